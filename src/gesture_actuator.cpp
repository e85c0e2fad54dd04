#include "gesture_actuator.h"
#include "logger.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace lingo {

namespace {

speed_t baud_constant(int baud) {
    switch (baud) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default: return 0;
    }
}

} // anonymous namespace

SerialGestureActuator::SerialGestureActuator(const ActuatorConfig& config)
    : config_(config) {}

SerialGestureActuator::~SerialGestureActuator() {
    close();
}

bool SerialGestureActuator::open() {
    speed_t speed = baud_constant(config_.baud);
    if (speed == 0) {
        Logger::error("Unsupported actuator baud rate: " + std::to_string(config_.baud));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) {
            return true;
        }

        int fd = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY);
        if (fd == -1) {
            Logger::error("Failed to open actuator " + config_.device + ": " + std::strerror(errno));
            return false;
        }

        struct termios options;
        if (tcgetattr(fd, &options) != 0) {
            Logger::error("Actuator " + config_.device + " is not a serial port: " + std::strerror(errno));
            ::close(fd);
            return false;
        }
        cfsetispeed(&options, speed);
        cfsetospeed(&options, speed);
        options.c_cflag |= (CLOCAL | CREAD);
        options.c_cflag &= ~CSIZE;
        options.c_cflag |= CS8;
        options.c_cflag &= ~PARENB;
        options.c_cflag &= ~CSTOPB;
        options.c_cflag &= ~CRTSCTS;
        options.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
        options.c_iflag &= ~(IXON | IXOFF | IXANY);
        options.c_oflag &= ~OPOST;
        if (tcsetattr(fd, TCSANOW, &options) != 0) {
            Logger::error("Failed to configure actuator " + config_.device + ": " + std::strerror(errno));
            ::close(fd);
            return false;
        }

        fd_ = fd;
    }

    Logger::info("Actuator open on " + config_.device + " @ " + std::to_string(config_.baud));

    // The controller may miss the first command after the port opens
    send(gesture::PARK);
    send(gesture::PARK);
    for (const auto& cmd : config_.startup_commands) {
        send(cmd);
    }
    return true;
}

void SerialGestureActuator::send(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        LOG_GESTURE("(not connected) " + command);
        return;
    }

    std::string line = command + "\n";
    size_t offset = 0;
    while (offset < line.size()) {
        ssize_t n = ::write(fd_, line.data() + offset, line.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            Logger::warn("[GESTURE] Write of \"" + command + "\" failed: " + std::strerror(errno));
            return;
        }
        offset += static_cast<size_t>(n);
    }
    LOG_GESTURE(command);
}

void SerialGestureActuator::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SerialGestureActuator::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

void LoggingGestureActuator::send(const std::string& command) {
    LOG_GESTURE("(dry run) " + command);
}

} // namespace lingo
