/**
 * Voice activity recorder with scripted frames.
 * Asserts:
 * - Energy gate threshold is the clamped median of the calibration frames.
 * - Recording stops once trailing silence after speech reaches silence_ms.
 * - No speech (or speech below the energy gate) yields an empty utterance at max_record_ms.
 * - Input device failures surface as DeviceError.
 * - A cancel issued between recordings ends the next record() before it opens the device.
 *
 * No PortAudio or libfvad required.
 */

#include "audio_io.h"
#include "common.h"
#include "config.h"
#include "errors.h"
#include "vad/vad_interface.h"
#include "voice_activity_recorder.h"
#include <iostream>
#include <string>
#include <vector>

using namespace lingo;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

// Frames of constant amplitude; silence after the script runs out
class ScriptedSource : public IFrameSource {
public:
    explicit ScriptedSource(std::vector<Sample> amplitudes) : amplitudes_(std::move(amplitudes)) {}

    bool open(int, int samples_per_frame) override {
        opens++;
        if (fail_open) return false;
        frame_samples_ = samples_per_frame;
        return true;
    }

    bool read_frame(AudioFrame& frame, int) override {
        if (fail_after >= 0 && delivered >= fail_after) return false;
        Sample amp = delivered < static_cast<int>(amplitudes_.size()) ? amplitudes_[delivered] : 0;
        frame.assign(static_cast<size_t>(frame_samples_), amp);
        delivered++;
        return true;
    }

    void close() override { closes++; }

    bool fail_open = false;
    int fail_after = -1;
    int delivered = 0;
    int opens = 0;
    int closes = 0;

private:
    std::vector<Sample> amplitudes_;
    int frame_samples_ = 0;
};

// Any non-zero frame is "speech" unless forced
class FakeClassifier : public vad::ISpeechClassifier {
public:
    bool configure(int, int) override { return true; }
    bool is_speech(const AudioFrame& frame) override {
        return always ? true : (!frame.empty() && frame[0] != 0);
    }
    void reset() override { resets++; }

    bool always = false;
    int resets = 0;
};

static std::vector<Sample> script(std::initializer_list<std::pair<int, Sample>> runs) {
    std::vector<Sample> out;
    for (const auto& run : runs) {
        out.insert(out.end(), static_cast<size_t>(run.first), run.second);
    }
    return out;
}

static RecorderConfig test_config() {
    RecorderConfig cfg;
    cfg.frame_ms = 20;
    cfg.calibration_ms = 100;   // 5 frames
    cfg.silence_ms = 200;       // 10 frames
    cfg.max_record_ms = 2000;   // 100 frames
    cfg.energy_margin = 2.0f;
    cfg.energy_min = 100.0f;
    cfg.energy_max = 6000.0f;
    return cfg;
}

int main() {
    const int rate = 16000;
    const size_t frame = static_cast<size_t>(samples_per_frame(rate, 20));

    // --- CalibrationState: clamped median ---
    CalibrationState calib(5, 2.0f, 100.0f, 6000.0f);
    ASSERT(!calib.add_sample(10.0f));
    ASSERT(!calib.add_sample(500.0f));
    ASSERT(!calib.add_sample(60.0f));
    ASSERT(!calib.add_sample(70.0f));
    ASSERT(calib.add_sample(80.0f));
    ASSERT(calib.is_complete());
    ASSERT(calib.threshold() == 140.0f);        // median 70 * 2
    ASSERT(!calib.add_sample(9000.0f));         // ignored once calibrated
    ASSERT(calib.threshold() == 140.0f);

    CalibrationState loud(3, 2.0f, 100.0f, 6000.0f);
    loud.add_sample(5000.0f);
    loud.add_sample(5000.0f);
    loud.add_sample(5000.0f);
    ASSERT(loud.threshold() == 6000.0f);

    CalibrationState quiet(3, 2.0f, 100.0f, 6000.0f);
    quiet.add_sample(1.0f);
    quiet.add_sample(1.0f);
    quiet.add_sample(1.0f);
    ASSERT(quiet.threshold() == 100.0f);

    // --- Speech then silence: stops after trailing silence ---
    {
        ScriptedSource source(script({{5, 50}, {20, 1000}}));
        FakeClassifier classifier;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        Result<Utterance> result = recorder.record();
        ASSERT(result.is_ok());
        if (result.is_ok()) {
            const Utterance& u = result.value();
            ASSERT(!u.empty());
            ASSERT(u.sample_rate == rate);
            ASSERT(u.channel_count == 1);
            ASSERT(u.pcm.size() == 35 * frame);  // 5 calibration + 20 speech + 10 silence
            ASSERT(u.duration_ms() == 700);
        }
        ASSERT(recorder.last_threshold() == 100.0f);
        ASSERT(source.delivered == 35);
        ASSERT(source.opens == 1);
        ASSERT(source.closes == 1);
        ASSERT(classifier.resets == 1);
    }

    // --- Pauses shorter than silence_ms do not end the utterance ---
    {
        ScriptedSource source(script({{5, 50}, {10, 1000}, {6, 0}, {10, 1000}}));
        FakeClassifier classifier;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        Result<Utterance> result = recorder.record();
        ASSERT(result.is_ok());
        ASSERT(source.delivered == 5 + 10 + 6 + 10 + 10);
    }

    // --- No speech at all: empty utterance after max_record_ms ---
    {
        ScriptedSource source(script({}));
        FakeClassifier classifier;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        Result<Utterance> result = recorder.record();
        ASSERT(result.is_ok());
        if (result.is_ok()) {
            ASSERT(result.value().empty());
        }
        ASSERT(source.delivered == 100);
    }

    // --- Classifier fires but energy stays below the gate ---
    {
        ScriptedSource source(script({{100, 50}}));
        FakeClassifier classifier;
        classifier.always = true;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        Result<Utterance> result = recorder.record();
        ASSERT(result.is_ok());
        if (result.is_ok()) {
            ASSERT(result.value().empty());
        }
    }

    // --- Continuous speech is cut at max_record_ms ---
    {
        ScriptedSource source(script({{5, 50}, {200, 1000}}));
        FakeClassifier classifier;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        Result<Utterance> result = recorder.record();
        ASSERT(result.is_ok());
        if (result.is_ok()) {
            ASSERT(result.value().pcm.size() == 100 * frame);
        }
        ASSERT(source.delivered == 100);
    }

    // --- No state carried between calls ---
    {
        ScriptedSource source(script({{5, 50}, {20, 1000}}));
        FakeClassifier classifier;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        ASSERT(recorder.record().is_ok());
        Result<Utterance> second = recorder.record();  // script exhausted: silence only
        ASSERT(second.is_ok());
        if (second.is_ok()) {
            ASSERT(second.value().empty());
        }
    }

    // --- Cancel before record(): the next call returns at once, once ---
    {
        ScriptedSource source(script({{5, 50}, {20, 1000}}));
        FakeClassifier classifier;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        recorder.cancel();
        Result<Utterance> cancelled = recorder.record();
        ASSERT(cancelled.is_ok());
        if (cancelled.is_ok()) {
            ASSERT(cancelled.value().empty());
        }
        ASSERT(source.opens == 0);
        ASSERT(source.delivered == 0);

        Result<Utterance> next = recorder.record();
        ASSERT(next.is_ok());
        if (next.is_ok()) {
            ASSERT(next.value().pcm.size() == 35 * frame);
        }
        ASSERT(source.opens == 1);
    }

    // --- Device errors ---
    {
        ScriptedSource source(script({{5, 50}}));
        source.fail_open = true;
        FakeClassifier classifier;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        Result<Utterance> result = recorder.record();
        ASSERT(result.is_error());
        if (result.is_error()) {
            ASSERT(result.error().type == ErrorType::DeviceError);
        }
    }
    {
        ScriptedSource source(script({{5, 50}, {20, 1000}}));
        source.fail_after = 12;
        FakeClassifier classifier;
        VoiceActivityRecorder recorder(test_config(), rate, source, classifier);
        Result<Utterance> result = recorder.record();
        ASSERT(result.is_error());
        if (result.is_error()) {
            ASSERT(result.error().type == ErrorType::DeviceError);
        }
        ASSERT(source.closes == 1);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All recorder tests passed.\n";
    return 0;
}
