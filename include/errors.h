#pragma once

#include <string>
#include <variant>
#include <stdexcept>

namespace lingo {

/**
 * @brief Failure classes a conversational turn can run into
 */
enum class ErrorType {
    None,
    DeviceError,         ///< Microphone or output device unavailable (fatal to the turn)
    BackendError,        ///< A completion backend failed (fatal only if every candidate failed)
    QuotaOrAuthError,    ///< Backend rejected credentials or is rate limited
    SynthesisPipeError,  ///< Synthesizer process pipe broke twice in a row
    ConfigError,
    InvalidState
};

inline const char* error_type_name(ErrorType type);

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    std::string describe() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Throws if error
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Throws if success
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Success/failure only
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_device_error(const std::string& message) {
    return Error(ErrorType::DeviceError, message);
}

inline Error make_backend_error(const std::string& message) {
    return Error(ErrorType::BackendError, message);
}

inline Error make_quota_error(const std::string& message) {
    return Error(ErrorType::QuotaOrAuthError, message);
}

inline Error make_pipe_error(const std::string& message) {
    return Error(ErrorType::SynthesisPipeError, message);
}

inline Error make_config_error(const std::string& message) {
    return Error(ErrorType::ConfigError, message);
}

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::DeviceError: return "DeviceError";
        case ErrorType::BackendError: return "BackendError";
        case ErrorType::QuotaOrAuthError: return "QuotaOrAuthError";
        case ErrorType::SynthesisPipeError: return "SynthesisPipeError";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

} // namespace lingo
