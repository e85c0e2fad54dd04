#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace lingo {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = Clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

inline int64_t ms_between(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Duration>(to - from).count();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int DEFAULT_FRAME_MS = 20;

inline int samples_per_frame(int sample_rate, int frame_ms) {
    return (sample_rate * frame_ms) / 1000;
}

// Piper default when the voice json carries no sample rate
constexpr int DEFAULT_SYNTH_SAMPLE_RATE = 22050;

/**
 * @brief One finalized, silence-bounded capture of spoken audio
 *
 * Owned by the turn that recorded it; handed to speech-to-text once.
 */
struct Utterance {
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channel_count = 1;
    AudioBuffer pcm;

    bool empty() const { return pcm.empty(); }
    int64_t duration_ms() const {
        return sample_rate > 0 ? static_cast<int64_t>(pcm.size()) * 1000 / sample_rate : 0;
    }
};

// Transcript result
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    int64_t processing_ms = 0;
    int64_t audio_ms = 0;     ///< Duration of the transcribed utterance
    int token_count = 0;
};

} // namespace lingo
