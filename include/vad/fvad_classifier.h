#pragma once

/**
 * @file fvad_classifier.h
 * @brief WebRTC voice activity classifier backed by libfvad
 */

#include "vad/vad_interface.h"

struct Fvad;

namespace lingo {
namespace vad {

/**
 * @brief libfvad classifier
 *
 * Supports 8/16/32/48 kHz and 10/20/30 ms frames. Aggressiveness 0 is the
 * most permissive, 3 the most likely to reject non-speech.
 */
class FvadClassifier : public ISpeechClassifier {
public:
    explicit FvadClassifier(int aggressiveness);
    ~FvadClassifier() override;

    FvadClassifier(const FvadClassifier&) = delete;
    FvadClassifier& operator=(const FvadClassifier&) = delete;

    bool configure(int sample_rate, int frame_ms) override;
    bool is_speech(const AudioFrame& frame) override;
    void reset() override;

private:
    Fvad* vad_;
    int aggressiveness_;
    int sample_rate_;
};

} // namespace vad
} // namespace lingo
