#include "audio_io.h"
#include "completion_backend.h"
#include "config.h"
#include "face_tracker.h"
#include "gesture_actuator.h"
#include "hedged_completion_client.h"
#include "key_manager.h"
#include "logger.h"
#include "speech_synthesizer.h"
#include "stt_engine.h"
#include "turn_orchestrator.h"
#include "utils.h"
#include "vad/fvad_classifier.h"
#include "voice_activity_recorder.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <signal.h>
#include <string>

namespace lingo {

static std::atomic<bool> g_quit{false};

void signal_handler(int) {
    g_quit = true;
}

static void install_signal_handlers() {
    // No SA_RESTART, so a blocked console read returns on Ctrl-C
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static void print_usage() {
    std::cout << "Enter = speak, text = type a message, /profile = next API profile, "
                 "/camera off|on = lend or take back the camera, /quit = exit" << std::endl;
}

static int run(const Config& config) {
    KeyManager keys(config.credentials);

    std::vector<std::shared_ptr<ICompletionBackend>> backends;
    for (const auto& provider : config.completion.providers) {
        backends.push_back(std::make_shared<OpenRouterBackend>(provider, config.completion, keys));
    }
    HedgedCompletionClient completion(backends, config.completion, [&keys] { return keys.active_label(); });

    STTEngine stt(config.stt);
    if (!stt.is_ready()) {
        Logger::error("Speech-to-text model failed to load: " + config.stt.model_path);
        return 1;
    }

    AudioInput microphone(config.audio.input_device);
    vad::FvadClassifier classifier(config.recorder.vad_aggressiveness);
    VoiceActivityRecorder recorder(config.recorder, config.audio.sample_rate, microphone, classifier);

    AudioOutput speaker(config.audio.output_device);
    PiperSynthesizer synthesizer(config.tts, speaker);
    if (!speaker.open(synthesizer.sample_rate())) {
        Logger::error("Failed to open output device: " + config.audio.output_device);
        return 1;
    }
    VoidResult synth_started = synthesizer.start();
    if (synth_started.is_error()) {
        Logger::error(synth_started.error().describe());
        return 1;
    }

    std::unique_ptr<IGestureActuator> actuator;
    auto serial = std::make_unique<SerialGestureActuator>(config.actuator);
    if (serial->open()) {
        actuator = std::move(serial);
    } else {
        Logger::warn("Continuing without the head controller");
        actuator = std::make_unique<LoggingGestureActuator>();
    }

    NullFaceLocator locator;
    FaceTracker tracker(config.tracker, *actuator, locator);
    if (config.tracker.enabled) {
        tracker.start();
    }

    ConsoleDisplay display;
    TurnOrchestrator orchestrator(config, TurnCollaborators{
        recorder, stt, completion, synthesizer, *actuator, tracker, display});
    orchestrator.start();

    Logger::info("=== Lingo Head Started ===");
    print_usage();

    std::string line;
    while (!g_quit && std::getline(std::cin, line)) {
        std::string command = utils::trim_copy(line);
        if (command == "/quit") {
            break;
        }
        if (command == "/profile") {
            keys.next_profile();
            display.show_notice("Switched to credential profile \"" + keys.active_label() + "\"");
            continue;
        }
        if (command == "/camera off") {
            orchestrator.lend_camera();
            display.show_notice("Camera released for another application");
            continue;
        }
        if (command == "/camera on") {
            orchestrator.return_camera();
            continue;
        }
        if (command == "/help") {
            print_usage();
            continue;
        }
        bool accepted = command.empty() ? orchestrator.speak() : orchestrator.submit_text(command);
        if (!accepted) {
            display.show_notice("Busy, wait for the current turn to finish");
        }
    }

    Logger::info("Shutting down...");
    orchestrator.stop();
    tracker.stop();
    synthesizer.close();
    speaker.close();
    microphone.close();
    return 0;
}

} // namespace lingo

int main(int argc, char* argv[]) {
    lingo::Logger::initialize(lingo::LogLevel::INFO);

    std::string config_path = "config/config.json";
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            lingo::AudioInput::list_devices();
            lingo::Logger::shutdown();
            return 0;
        }
        if (arg == "--verbose") {
            verbose = true;
        } else {
            config_path = arg;
        }
    }

    lingo::Config config = lingo::Config::load_from_file(config_path);
    lingo::Logger::shutdown();
    lingo::Logger::initialize(verbose ? lingo::LogLevel::DEBUG : lingo::Logger::parse_level(config.logging.level),
                              config.logging.file);

    lingo::VoidResult valid = config.validate();
    if (valid.is_error()) {
        lingo::Logger::error(valid.error().describe());
        lingo::Logger::shutdown();
        return 1;
    }

    lingo::install_signal_handlers();
    int result = lingo::run(config);

    lingo::Logger::shutdown();
    return result;
}
