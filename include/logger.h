#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace lingo {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Lines go to stderr (stdout carries the conversation) and optionally to a
 * file. Each line carries a short per-thread tag so output from the control
 * thread, racing candidates, the synthesizer pump and the tracker can be
 * told apart. Before initialize() only INFO and above reach stderr.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO, 
                          const std::string& output_file = "");
    
    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();
    
    /**
     * @brief Log a message at DEBUG level
     */
    static void debug(const std::string& message);
    
    /**
     * @brief Log a message at INFO level
     */
    static void info(const std::string& message);
    
    /**
     * @brief Log a message at WARN level
     */
    static void warn(const std::string& message);
    
    /**
     * @brief Log a message at ERROR level
     */
    static void error(const std::string& message);
    
    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);
    
    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

    /**
     * @brief Parse a level name ("debug", "info", "warn", "error"); unknown names give INFO
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;
    
    static void log(LogLevel level, const std::string& message);
};

// Convenience macros for component-specific logging
#define LOG_DEBUG(msg) lingo::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) lingo::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_VAD(msg) lingo::Logger::debug(std::string("[VAD] ") + (msg))
#define LOG_STT(msg) lingo::Logger::info(std::string("[STT] ") + (msg))
#define LOG_LLM(msg) lingo::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_TTS(msg) lingo::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_TURN(msg) lingo::Logger::info(std::string("[Turn] ") + (msg))
#define LOG_GESTURE(msg) lingo::Logger::debug(std::string("[Gesture] ") + (msg))
#define LOG_TRACK(msg) lingo::Logger::debug(std::string("[Track] ") + (msg))
#define LOG_TRACE(turn_id, stage, data) lingo::Logger::info(std::string("[trace] turn_id=") + std::to_string(turn_id) + " stage=" + (stage) + " " + (data))

} // namespace lingo
