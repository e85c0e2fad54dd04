#pragma once

#include "config.h"
#include <memory>
#include <mutex>
#include <string>

namespace lingo {

// Gesture commands understood by the head controller
namespace gesture {
constexpr const char* LISTEN_LEFT = "listen_left";
constexpr const char* LISTEN_RIGHT = "listen_right";
constexpr const char* THINK = "think";
constexpr const char* TALK = "talk";
constexpr const char* STOP = "stop";
constexpr const char* PARK = "park";
constexpr const char* TRACK_ON = "track_on";
constexpr const char* TRACK_OFF = "track_off";
}

/**
 * @brief Fire-and-forget sink for opaque actuator commands
 */
class IGestureActuator {
public:
    virtual ~IGestureActuator() = default;

    /// Never blocks on an acknowledgement and never throws; failures are logged
    virtual void send(const std::string& command) = 0;
};

/**
 * @brief Head controller on a serial line (8N1, newline-terminated commands)
 *
 * Thread Safety: send() may be called from the control thread and the face
 * tracker thread; writes are serialized so commands never interleave.
 */
class SerialGestureActuator : public IGestureActuator {
public:
    explicit SerialGestureActuator(const ActuatorConfig& config);
    ~SerialGestureActuator() override;

    SerialGestureActuator(const SerialGestureActuator&) = delete;
    SerialGestureActuator& operator=(const SerialGestureActuator&) = delete;

    /**
     * @brief Open the port and run the startup sequence (park twice, then config commands)
     * @return False if the port cannot be opened (logged); send() is then a no-op
     */
    bool open();

    void send(const std::string& command) override;

    void close();

    bool is_open() const;

private:
    ActuatorConfig config_;
    mutable std::mutex mutex_;
    int fd_ = -1;
};

/**
 * @brief Actuator used when no serial device is configured; logs commands only
 */
class LoggingGestureActuator : public IGestureActuator {
public:
    void send(const std::string& command) override;
};

} // namespace lingo
