#include "logger.h"
#include <atomic>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace lingo {

namespace {

// Short, stable per-thread tag ("t1", "t2", ...) so interleaved lines from
// the control thread, candidate threads, the synth pump and the tracker can be told apart
int thread_tag() {
    static std::atomic<int> next_tag{1};
    thread_local int tag = next_tag.fetch_add(1);
    return tag;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string format_line(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time_t, &local);

    // Format: [LEVEL] HH:MM:SS.mmm tN: message
    std::ostringstream oss;
    oss << "[" << level_name(level) << "] "
        << std::put_time(&local, "%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count()
        << " t" << thread_tag()
        << ": " << message;
    return oss.str();
}

std::mutex fallback_mutex;

} // anonymous namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file)
        : min_level_(min_level) {
        if (!output_file.empty()) {
            file_stream_ = std::make_unique<std::ofstream>(output_file, std::ios::app);
            if (!file_stream_->is_open()) {
                std::cerr << "Warning: Failed to open log file: " << output_file << std::endl;
                file_stream_.reset();
            }
        }
    }

    void log(LogLevel level, const std::string& message) {
        if (level < min_level_.load()) {
            return;
        }
        std::string formatted = format_line(level, message);

        std::lock_guard<std::mutex> lock(mutex_);
        // stdout belongs to the conversation display; diagnostics go to stderr
        std::cerr << formatted << std::endl;
        if (file_stream_) {
            *file_stream_ << formatted << std::endl;
        }
    }

    void set_level(LogLevel level) {
        min_level_ = level;
    }

    LogLevel get_level() const {
        return min_level_.load();
    }

private:
    std::mutex mutex_;
    std::atomic<LogLevel> min_level_;
    std::unique_ptr<std::ofstream> file_stream_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        impl_->log(level, message);
        return;
    }
    // Not initialized (tests, early startup): default filter, console only
    if (level < LogLevel::INFO) {
        return;
    }
    std::string formatted = format_line(level, message);
    std::lock_guard<std::mutex> lock(fallback_mutex);
    std::cerr << formatted << std::endl;
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    if (impl_) {
        return impl_->get_level();
    }
    return LogLevel::INFO;
}

LogLevel Logger::parse_level(const std::string& name) {
    if (name == "debug" || name == "DEBUG") return LogLevel::DEBUG;
    if (name == "warn" || name == "WARN" || name == "warning") return LogLevel::WARN;
    if (name == "error" || name == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

} // namespace lingo
