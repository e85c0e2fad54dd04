#pragma once

/**
 * @file vad_interface.h
 * @brief Voice activity classification interface
 *
 * A classifier only answers "does this frame contain speech". Energy gating,
 * calibration and endpointing live in VoiceActivityRecorder so classifier
 * backends stay interchangeable (WebRTC-style, energy-only, test fakes).
 */

#include "common.h"
#include <cmath>
#include <memory>

namespace lingo {
namespace vad {

/**
 * @brief Abstract per-frame speech classifier
 */
class ISpeechClassifier {
public:
    virtual ~ISpeechClassifier() = default;

    /**
     * @brief Prepare for frames of the given format
     * @return False if the format is unsupported
     */
    virtual bool configure(int sample_rate, int frame_ms) = 0;

    /**
     * @brief Classify one frame
     * @param frame Exactly sample_rate * frame_ms / 1000 samples
     */
    virtual bool is_speech(const AudioFrame& frame) = 0;

    /// Clear any internal smoothing state between recordings
    virtual void reset() = 0;
};

/**
 * @brief Root-mean-square energy of a frame in int16 units
 */
inline float frame_rms(const AudioFrame& frame) {
    if (frame.empty()) return 0.0f;
    double sum = 0.0;
    for (Sample s : frame) {
        double v = static_cast<double>(s);
        sum += v * v;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(frame.size())));
}

} // namespace vad
} // namespace lingo
