#include "voice_activity_recorder.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <sstream>

namespace lingo {

namespace {

// A frame source that delivers nothing for this long is treated as a dead device
constexpr int FRAME_TIMEOUT_MS = 1000;

} // anonymous namespace

// ============================================================================
// CalibrationState
// ============================================================================

CalibrationState::CalibrationState(int frames_needed, float margin, float min_threshold, float max_threshold)
    : frames_needed_(std::max(1, frames_needed))
    , margin_(margin)
    , min_threshold_(min_threshold)
    , max_threshold_(max_threshold)
    , threshold_(0.0f)
    , complete_(false) {
    rms_samples_.reserve(static_cast<size_t>(frames_needed_));
}

bool CalibrationState::add_sample(float rms) {
    if (complete_) return false;
    rms_samples_.push_back(rms);
    if (static_cast<int>(rms_samples_.size()) < frames_needed_) {
        return false;
    }
    std::vector<float> sorted = rms_samples_;
    std::sort(sorted.begin(), sorted.end());
    float median = sorted[sorted.size() / 2];
    threshold_ = std::clamp(median * margin_, min_threshold_, max_threshold_);
    complete_ = true;
    return true;
}

// ============================================================================
// VoiceActivityRecorder
// ============================================================================

class VoiceActivityRecorder::Impl {
public:
    Impl(const RecorderConfig& config, int sample_rate,
         IFrameSource& source, vad::ISpeechClassifier& classifier)
        : config_(config)
        , sample_rate_(sample_rate)
        , source_(source)
        , classifier_(classifier)
        , cancelled_(false)
        , last_threshold_(0.0f) {
        frame_samples_ = samples_per_frame(sample_rate_, config_.frame_ms);
        calib_frames_ = std::max(1, config_.calibration_ms / config_.frame_ms);
        silence_frames_needed_ = std::max(1, config_.silence_ms / config_.frame_ms);
        max_frames_ = std::max(1, config_.max_record_ms / config_.frame_ms);
    }

    Result<Utterance> record() {
        // A cancel that arrived between recordings is consumed here
        if (cancelled_.exchange(false)) {
            LOG_VAD("Recording cancelled before it started");
            Utterance none;
            none.sample_rate = sample_rate_;
            return none;
        }

        if (!classifier_.configure(sample_rate_, config_.frame_ms)) {
            return make_device_error("voice activity classifier rejected " +
                                     std::to_string(sample_rate_) + " Hz / " +
                                     std::to_string(config_.frame_ms) + " ms frames");
        }
        classifier_.reset();

        if (!source_.open(sample_rate_, frame_samples_)) {
            return make_device_error("could not open input device");
        }

        CalibrationState calibration(calib_frames_, config_.energy_margin,
                                     config_.energy_min, config_.energy_max);
        std::vector<AudioFrame> ring;
        ring.reserve(static_cast<size_t>(max_frames_));

        bool voiced = false;
        int trailing_silence = 0;
        int total = 0;
        int voiced_frames = 0;
        AudioFrame frame;

        while (!cancelled_) {
            if (!source_.read_frame(frame, FRAME_TIMEOUT_MS)) {
                if (cancelled_) break;
                source_.close();
                return make_device_error("input device stopped delivering frames");
            }
            if (static_cast<int>(frame.size()) != frame_samples_) {
                frame.resize(static_cast<size_t>(frame_samples_), 0);
            }

            float rms = vad::frame_rms(frame);
            ring.push_back(frame);
            total++;

            if (!calibration.is_complete()) {
                if (calibration.add_sample(rms)) {
                    std::ostringstream oss;
                    oss << "Calibrated energy threshold " << calibration.threshold()
                        << " over " << calibration.samples_collected() << " frames";
                    LOG_VAD(oss.str());
                }
            } else {
                bool speech = classifier_.is_speech(frame) && rms >= calibration.threshold();
                if (speech) {
                    voiced = true;
                    voiced_frames++;
                    trailing_silence = 0;
                } else if (voiced) {
                    trailing_silence = std::min(silence_frames_needed_, trailing_silence + 1);
                }
            }

            if (total >= max_frames_) {
                LOG_VAD("Max recording duration reached");
                break;
            }
            if (voiced && trailing_silence >= silence_frames_needed_) {
                break;
            }
        }

        source_.close();
        cancelled_ = false;
        last_threshold_ = calibration.threshold();

        Utterance utterance;
        utterance.sample_rate = sample_rate_;
        utterance.channel_count = 1;
        if (voiced) {
            utterance.pcm.reserve(ring.size() * static_cast<size_t>(frame_samples_));
            for (const auto& f : ring) {
                utterance.pcm.insert(utterance.pcm.end(), f.begin(), f.end());
            }
        }

        std::ostringstream oss;
        oss << "Recorded " << total << " frames, " << voiced_frames << " voiced, "
            << utterance.duration_ms() << " ms kept";
        LOG_VAD(oss.str());
        return utterance;
    }

    void cancel() {
        cancelled_ = true;
    }

    float last_threshold() const {
        return last_threshold_;
    }

private:
    RecorderConfig config_;
    int sample_rate_;
    IFrameSource& source_;
    vad::ISpeechClassifier& classifier_;
    std::atomic<bool> cancelled_;
    std::atomic<float> last_threshold_;

    int frame_samples_;
    int calib_frames_;
    int silence_frames_needed_;
    int max_frames_;
};

VoiceActivityRecorder::VoiceActivityRecorder(const RecorderConfig& config, int sample_rate,
                                             IFrameSource& source, vad::ISpeechClassifier& classifier)
    : pimpl_(std::make_unique<Impl>(config, sample_rate, source, classifier)) {}

VoiceActivityRecorder::~VoiceActivityRecorder() = default;

Result<Utterance> VoiceActivityRecorder::record() {
    return pimpl_->record();
}

void VoiceActivityRecorder::cancel() {
    pimpl_->cancel();
}

float VoiceActivityRecorder::last_threshold() const {
    return pimpl_->last_threshold();
}

} // namespace lingo
