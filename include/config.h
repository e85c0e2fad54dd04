#pragma once

#include "errors.h"
#include <string>
#include <cstdint>
#include <vector>

namespace lingo {

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int sample_rate = 16000;
};

/// Utterance capture: energy gate calibration plus voice-activity classification
struct RecorderConfig {
    int frame_ms = 20;                 ///< 10, 20 or 30 (classifier frame sizes)
    int vad_aggressiveness = 3;        ///< 0 (least) .. 3 (most aggressive)
    int silence_ms = 1200;             ///< Trailing silence that ends an utterance
    int max_record_ms = 10000;         ///< Absolute cap per recording
    float energy_margin = 2.0f;        ///< Threshold = median(calibration RMS) * margin
    float energy_min = 2200.0f;        ///< Clamp band for the threshold, int16 RMS units
    float energy_max = 6000.0f;
    int calibration_ms = 500;          ///< Leading window used only for calibration
};

struct STTConfig {
    std::string model_path;
    std::string language = "en";
    int n_threads = 4;
    bool use_gpu = true;
};

/// One interchangeable chat-completion provider
struct ProviderConfig {
    std::string name;
    std::string endpoint = "https://openrouter.ai/api/v1/chat/completions";
    std::string model;
    std::string key_name = "OPENROUTER_API_KEY";  ///< Looked up in the active credential profile
};

struct CompletionConfig {
    /// First two race from the start; the third (if any) is the watchdog backup
    std::vector<ProviderConfig> providers;
    int first_token_timeout_ms = 6000;
    int request_timeout_ms = 30000;
    int connect_timeout_ms = 3000;
    int max_tokens = 48;
    float temperature = 0.4f;
    std::vector<std::string> stop_sequences = {"\n\n", "Question:", "Q:", "Lingo:", "You:"};
    std::string system_prompt = "You are Lingo, a friendly robot language tutor. "
                                "Answer in one or two short spoken sentences. No lists, no markdown.";
    int history_turns = 4;             ///< Prior messages sent with each request
    int dedup_window_chars = 1024;     ///< Trailing emitted text searched for replayed fragments
    int dedup_min_chars = 8;           ///< Shorter fragments are never treated as replays
    std::string referer = "http://localhost:3000";
    std::string title = "Lingo Head";
};

struct CredentialsConfig {
    std::string keys_file = "~/.config/lingo/keys.json";
    std::string settings_file = "~/.config/lingo/settings.json";
};

struct ChunkerConfig {
    int max_words = 10;
    int max_interval_ms = 900;
};

struct TTSConfig {
    std::string piper_path;            ///< Piper binary (empty = auto-detect)
    std::string voice_path;
    std::string espeak_data_path;      ///< espeak-ng data dir (empty = platform default)
    int sample_rate = 0;               ///< 0 = read from the voice json
    float sentence_silence = 0.25f;
};

struct TurnConfig {
    int drain_holdoff_ms = 600;        ///< Synth silence required before the reply is committed
    int idle_settle_ms = 5000;         ///< Delay before face tracking resumes after a turn
    int stop_repeat_gap_ms = 120;      ///< Spacing of the two stop gestures
    int login_resume_ms = 1200;        ///< Delay before tracking resumes after the camera is returned
    size_t chunk_queue_capacity = 64;
};

struct ActuatorConfig {
    std::string device = "/dev/ttyUSB0";
    int baud = 115200;
    std::vector<std::string> startup_commands = {
        "set_total_listen 6000", "set_return 2500", "set_total_think 10000"};
};

struct TrackerConfig {
    bool enabled = true;
    float gaze_rate_hz = 10.0f;
    float deadband_deg = 1.0f;
    int min_dwell_ms = 1500;           ///< Minimum spacing of gaze commands
    int open_grace_ms = 1000;          ///< Wait after resume before reopening the camera
    int retry_backoff_ms = 2500;       ///< Back-off after the camera fails to open or capture
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    AudioConfig audio;
    RecorderConfig recorder;
    STTConfig stt;
    CompletionConfig completion;
    CredentialsConfig credentials;
    ChunkerConfig chunker;
    TTSConfig tts;
    TurnConfig turn;
    ActuatorConfig actuator;
    TrackerConfig tracker;
    LoggingConfig logging;

    Config();

    static Config load_from_file(const std::string& path);
    static Config load_from_string(const std::string& json_text);
    void save_to_file(const std::string& path) const;

    /// First violated constraint as a ConfigError
    VoidResult validate() const;
};

} // namespace lingo
