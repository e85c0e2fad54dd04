#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include "audio_io.h"
#include "vad/vad_interface.h"
#include <vector>
#include <memory>

namespace lingo {

/**
 * @brief Anything that can capture one utterance on demand
 */
class IUtteranceRecorder {
public:
    virtual ~IUtteranceRecorder() = default;

    /// Blocks until the utterance ends; an empty utterance means no speech was heard
    virtual Result<Utterance> record() = 0;

    /// Make a blocked record() return early; if none is running, the next one returns at once (thread-safe)
    virtual void cancel() = 0;
};

/**
 * @brief Energy gate threshold learned from the first frames of a recording
 *
 * Collects one RMS value per frame until the calibration window is full, then
 * fixes threshold = clamp(median * margin, min, max). Immutable afterwards.
 */
class CalibrationState {
public:
    CalibrationState(int frames_needed, float margin, float min_threshold, float max_threshold);

    /// Record one frame's RMS; ignored once calibrated. Returns true when this sample completed calibration.
    bool add_sample(float rms);

    bool is_complete() const { return complete_; }
    int samples_collected() const { return static_cast<int>(rms_samples_.size()); }
    float threshold() const { return threshold_; }

private:
    int frames_needed_;
    float margin_;
    float min_threshold_;
    float max_threshold_;
    std::vector<float> rms_samples_;
    float threshold_;
    bool complete_;
};

/**
 * @brief Records one silence-bounded utterance per call
 *
 * Each call opens the frame source, calibrates the energy gate, then
 * classifies frames as speech only when the classifier and the gate agree.
 * Recording stops once trailing silence after the first voiced frame reaches
 * silence_ms, or once max_record_ms of audio has been captured.
 */
class VoiceActivityRecorder : public IUtteranceRecorder {
public:
    VoiceActivityRecorder(const RecorderConfig& config, int sample_rate,
                          IFrameSource& source, vad::ISpeechClassifier& classifier);
    ~VoiceActivityRecorder() override;

    VoiceActivityRecorder(const VoiceActivityRecorder&) = delete;
    VoiceActivityRecorder& operator=(const VoiceActivityRecorder&) = delete;

    /**
     * @brief Capture one utterance
     * @return Utterance (empty if no speech was heard), or DeviceError
     */
    Result<Utterance> record() override;

    void cancel() override;

    /// Energy threshold computed by the most recent record() (0 before calibration)
    float last_threshold() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lingo
