#include "vad/fvad_classifier.h"
#include "logger.h"
#include <fvad.h>

namespace lingo {
namespace vad {

FvadClassifier::FvadClassifier(int aggressiveness)
    : vad_(fvad_new()), aggressiveness_(aggressiveness), sample_rate_(0) {
    if (!vad_) {
        Logger::error("Failed to create fvad instance");
        return;
    }
    if (fvad_set_mode(vad_, aggressiveness_) != 0) {
        Logger::warn("Invalid VAD aggressiveness " + std::to_string(aggressiveness_) + ", using 3");
        aggressiveness_ = 3;
        fvad_set_mode(vad_, aggressiveness_);
    }
}

FvadClassifier::~FvadClassifier() {
    if (vad_) {
        fvad_free(vad_);
    }
}

bool FvadClassifier::configure(int sample_rate, int frame_ms) {
    if (!vad_) return false;
    if (frame_ms != 10 && frame_ms != 20 && frame_ms != 30) {
        Logger::error("fvad needs 10, 20 or 30 ms frames, got " + std::to_string(frame_ms));
        return false;
    }
    if (fvad_set_sample_rate(vad_, sample_rate) != 0) {
        Logger::error("fvad does not support sample rate " + std::to_string(sample_rate));
        return false;
    }
    sample_rate_ = sample_rate;
    return true;
}

bool FvadClassifier::is_speech(const AudioFrame& frame) {
    if (!vad_ || sample_rate_ == 0) return false;
    int result = fvad_process(vad_, frame.data(), frame.size());
    if (result < 0) {
        LOG_VAD("fvad rejected frame of " + std::to_string(frame.size()) + " samples");
        return false;
    }
    return result == 1;
}

void FvadClassifier::reset() {
    if (!vad_) return;
    // fvad_reset also clears mode and rate
    fvad_reset(vad_);
    fvad_set_mode(vad_, aggressiveness_);
    if (sample_rate_ != 0) {
        fvad_set_sample_rate(vad_, sample_rate_);
    }
}

} // namespace vad
} // namespace lingo
