#pragma once

#include "config.h"
#include "gesture_actuator.h"
#include <memory>
#include <optional>
#include <string>

namespace lingo {

/**
 * @brief Largest detected face, as a fraction of the frame (0..1 each axis)
 */
struct FacePosition {
    float x = 0.5f;
    float y = 0.5f;
};

/**
 * @brief Camera plus face detector, owned by the tracker while it runs
 */
class IFaceLocator {
public:
    virtual ~IFaceLocator() = default;

    /// Acquire the camera; false if it is busy or missing
    virtual bool open() = 0;

    /// Release the camera so another flow can open it
    virtual void close() = 0;

    /**
     * @brief Capture one frame and find the largest face
     * @return nullopt when no face is visible; false in ok when capture failed
     */
    virtual std::optional<FacePosition> locate(bool& ok) = 0;
};

/**
 * @brief Pausable collaborator that competes for the camera
 */
class IFaceTracker {
public:
    virtual ~IFaceTracker() = default;

    /// Stop steering, send track_off if tracking was on, release the camera
    virtual void pause() = 0;

    /// Allow the loop to reacquire the camera and resume steering
    virtual void resume() = 0;
};

/**
 * @brief Background loop steering the head towards the nearest face
 *
 * While running and not paused the loop sends track_on once, then maps the
 * face position into the head's safe angle range and sends
 * "gaze <ud> <lr>" at most gaze_rate_hz times per second, only when the
 * target moved by at least deadband_deg and min_dwell_ms has passed since
 * the previous gaze.
 *
 * Thread Safety: pause()/resume() may be called from any thread. The camera
 * is released before pause() returns.
 */
class FaceTracker : public IFaceTracker {
public:
    FaceTracker(const TrackerConfig& config, IGestureActuator& actuator, IFaceLocator& locator);
    ~FaceTracker() override;

    FaceTracker(const FaceTracker&) = delete;
    FaceTracker& operator=(const FaceTracker&) = delete;

    void start();
    void stop();

    void pause() override;
    void resume() override;

    bool is_paused() const;

    /// "gaze <ud> <lr>" with one decimal
    static std::string gaze_command(float ud_deg, float lr_deg);

    /// Map a face position to head angles (up/down, left/right), clamped to the safe range
    static void face_to_angles(const FacePosition& face, float& ud_deg, float& lr_deg);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Locator for builds without a camera; never sees a face
 */
class NullFaceLocator : public IFaceLocator {
public:
    bool open() override { return true; }
    void close() override {}
    std::optional<FacePosition> locate(bool& ok) override {
        ok = true;
        return std::nullopt;
    }
};

} // namespace lingo
