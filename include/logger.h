#pragma once

#include <string>
#include <memory>

namespace avatar_tutor {

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
 * Process-wide facade with levels and optional file output. Session workers,
 * the speech dispatcher and the renderer all log through it concurrently.
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

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
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
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return Parsed level, or fallback when the name is not recognized
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Convenience macros for component-specific logging
#define LOG_DEBUG(msg) avatar_tutor::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) avatar_tutor::Logger::info(msg)
#define LOG_WARN(msg) avatar_tutor::Logger::warn(msg)
#define LOG_ERROR(msg) avatar_tutor::Logger::error(msg)

// Component-specific logging macros
#define LOG_SESSION(msg) avatar_tutor::Logger::info(std::string("[Session] ") + (msg))
#define LOG_INPUT(msg) avatar_tutor::Logger::info(std::string("[Input] ") + (msg))
#define LOG_LLM(msg) avatar_tutor::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_SPEECH(msg) avatar_tutor::Logger::debug(std::string("[Speech] ") + (msg))
#define LOG_RENDER(msg) avatar_tutor::Logger::debug(std::string("[Render] ") + (msg))
#define LOG_TRACE(turn_id, stage, data) avatar_tutor::Logger::info(std::string("[trace] turn_id=") + std::to_string(turn_id) + " stage=" + (stage) + " " + (data))

} // namespace avatar_tutor
