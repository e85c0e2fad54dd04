#include "face_tracker.h"
#include "common.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <thread>

namespace lingo {

namespace {

// Safe mechanical range of the head
constexpr float UD_MIN = 135.0f;
constexpr float UD_MAX = 165.0f;
constexpr float UD_MID = 150.0f;
constexpr float LR_MIN = 60.0f;
constexpr float LR_MAX = 110.0f;
constexpr float LR_MID = 85.0f;

// Extra push towards the target so small offsets still move the head
constexpr float EXTRA_DEG = 10.0f;

constexpr const char* HOME_GAZE = "gaze 140 85";
constexpr int PAUSED_POLL_MS = 120;

} // anonymous namespace

class FaceTracker::Impl {
public:
    Impl(const TrackerConfig& config, IGestureActuator& actuator, IFaceLocator& locator)
        : config_(config), actuator_(actuator), locator_(locator) {
        period_ms_ = static_cast<int>(1000.0f / std::max(0.1f, config_.gaze_rate_hz));
    }

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (thread_.joinable()) return;
        running_ = true;
        active_since_ = Clock::now();
        thread_ = std::thread(&Impl::loop, this);
        LOG_TRACK("Tracker started");
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            running_ = false;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            send_track_off_locked();
        }
        release_camera();
        LOG_TRACK("Tracker stopped");
    }

    void pause() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            paused_ = true;
            send_track_off_locked();
        }
        cv_.notify_all();
        release_camera();
        LOG_TRACK("Tracker paused");
    }

    void resume() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!paused_) return;
            paused_ = false;
            active_since_ = Clock::now();
        }
        cv_.notify_all();
        LOG_TRACK("Tracker resumed");
    }

    bool is_paused() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return paused_;
    }

private:
    void send_track_off_locked() {
        if (track_on_sent_) {
            actuator_.send(gesture::TRACK_OFF);
            track_on_sent_ = false;
        }
    }

    void release_camera() {
        std::lock_guard<std::mutex> cam_lock(camera_mutex_);
        if (camera_open_) {
            locator_.close();
            camera_open_ = false;
            LOG_TRACK("Camera released");
        }
    }

    // False when the loop should exit
    bool wait_ms(int ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return !running_; });
        return running_;
    }

    void loop() {
        while (true) {
            TimePoint cycle_start = Clock::now();
            TimePoint active_since;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (!running_) break;
                if (paused_) {
                    cv_.wait_for(lock, std::chrono::milliseconds(PAUSED_POLL_MS),
                                 [this] { return !running_ || !paused_; });
                    continue;
                }
                if (!track_on_sent_) {
                    actuator_.send(gesture::TRACK_ON);
                    actuator_.send(HOME_GAZE);
                    track_on_sent_ = true;
                }
                active_since = active_since_;
            }

            if (!step(active_since)) {
                continue;
            }

            int64_t elapsed = ms_since(cycle_start);
            int sleep_left = period_ms_ - static_cast<int>(elapsed);
            if (sleep_left > 0 && !wait_ms(sleep_left)) break;
        }
    }

    // One capture and steer cycle; false if the cycle already waited
    bool step(TimePoint active_since) {
        TimePoint now = Clock::now();
        if (now < next_retry_) {
            wait_ms(100);
            return false;
        }

        std::optional<FacePosition> face;
        {
            std::lock_guard<std::mutex> cam_lock(camera_mutex_);
            if (is_paused()) return false;

            if (!camera_open_) {
                // Give a flow that just returned the camera time to tear down
                if (ms_between(active_since, now) < config_.open_grace_ms) {
                    return true;
                }
                if (!locator_.open()) {
                    Logger::warn("[TRACK] Camera busy, retrying in " +
                                 std::to_string(config_.retry_backoff_ms) + " ms");
                    next_retry_ = Clock::now() + std::chrono::milliseconds(config_.retry_backoff_ms);
                    return true;
                }
                camera_open_ = true;
                LOG_TRACK("Camera acquired");
            }

            bool ok = true;
            face = locator_.locate(ok);
            if (!ok) {
                locator_.close();
                camera_open_ = false;
                Logger::warn("[TRACK] Capture failed, releasing camera");
                next_retry_ = Clock::now() + std::chrono::milliseconds(config_.retry_backoff_ms);
                return true;
            }
        }

        if (face) {
            steer(*face);
        }
        return true;
    }

    void steer(const FacePosition& face) {
        float ud = 0.0f;
        float lr = 0.0f;
        FaceTracker::face_to_angles(face, ud, lr);

        bool moved = !last_sent_ || std::fabs(ud - last_ud_) >= config_.deadband_deg ||
                     std::fabs(lr - last_lr_) >= config_.deadband_deg;
        if (!moved) return;
        if (last_sent_ && ms_since(last_send_time_) < config_.min_dwell_ms) return;

        std::lock_guard<std::mutex> lock(mutex_);
        if (paused_ || !running_) return;
        actuator_.send(FaceTracker::gaze_command(ud, lr));
        last_ud_ = ud;
        last_lr_ = lr;
        last_sent_ = true;
        last_send_time_ = Clock::now();
    }

    TrackerConfig config_;
    IGestureActuator& actuator_;
    IFaceLocator& locator_;
    int period_ms_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool paused_ = false;
    bool track_on_sent_ = false;
    TimePoint active_since_;
    std::thread thread_;

    std::mutex camera_mutex_;
    bool camera_open_ = false;

    // Loop thread only
    TimePoint next_retry_;
    bool last_sent_ = false;
    float last_ud_ = 0.0f;
    float last_lr_ = 0.0f;
    TimePoint last_send_time_;
};

FaceTracker::FaceTracker(const TrackerConfig& config, IGestureActuator& actuator, IFaceLocator& locator)
    : pimpl_(std::make_unique<Impl>(config, actuator, locator)) {}

FaceTracker::~FaceTracker() = default;

void FaceTracker::start() {
    pimpl_->start();
}

void FaceTracker::stop() {
    pimpl_->stop();
}

void FaceTracker::pause() {
    pimpl_->pause();
}

void FaceTracker::resume() {
    pimpl_->resume();
}

bool FaceTracker::is_paused() const {
    return pimpl_->is_paused();
}

std::string FaceTracker::gaze_command(float ud_deg, float lr_deg) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "gaze %.1f %.1f", ud_deg, lr_deg);
    return buf;
}

void FaceTracker::face_to_angles(const FacePosition& face, float& ud_deg, float& lr_deg) {
    float ud = UD_MIN + (UD_MAX - UD_MIN) * face.y;
    float lr = LR_MIN + (LR_MAX - LR_MIN) * face.x;
    ud += (ud < UD_MID) ? -EXTRA_DEG : EXTRA_DEG;
    lr += (lr < LR_MID) ? -EXTRA_DEG : EXTRA_DEG;
    ud_deg = std::clamp(ud, UD_MIN, UD_MAX);
    lr_deg = std::clamp(lr, LR_MIN, LR_MAX);
}

} // namespace lingo
