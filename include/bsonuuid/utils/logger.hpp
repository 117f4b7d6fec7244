/**
 * @file logger.hpp
 * @brief Thread-safe native logging for BsonUuid.
 *
 * Leveled, component-tagged log lines with timestamps. Output goes to
 * std::cerr unless another sink is installed with Logger::setSink().
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#include "bsonuuid/utils/export.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace bsonuuid {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Parse a level name ("TRACE" .. "FATAL", "OFF").
 *
 * Matching is case sensitive. Anything unrecognized maps to INFO.
 */
BSONUUID_UTILS_API LogLevel parseLogLevel(const std::string& name);

/**
 * @class Logger
 * @brief Thread-safe singleton logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Random", "Entropy estimate: {}", entropy);
 * LOG_WARN("CLI", "Ignoring value {} for {}", value, option);
 * @endcode
 *
 * FATAL is a severity only; the logger never terminates the process.
 */
class BSONUUID_UTILS_API Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colors around the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores std::cerr.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setSink(std::ostream* sink);

    /**
     * @brief Name of a level without padding, e.g. "INFO".
     */
    static std::string levelName(LogLevel level);

    /**
     * @brief Log a message. Each "{}" in @p format is replaced by the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::ostringstream message;
        appendFormatted(message, format, std::forward<Args>(args)...);
        write(level, component, message.str());
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void appendFormatted(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    template<typename T, typename... Args>
    static void appendFormatted(std::ostringstream& oss, const char* format, T&& value, Args&&... args) {
        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                appendFormatted(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format++;
        }
    }

    void write(LogLevel level, const std::string& component, const std::string& message);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::ostream* sink_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace bsonuuid

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::bsonuuid::utils::Logger::instance().log(::bsonuuid::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::bsonuuid::utils::Logger::instance().log(::bsonuuid::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::bsonuuid::utils::Logger::instance().log(::bsonuuid::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::bsonuuid::utils::Logger::instance().log(::bsonuuid::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::bsonuuid::utils::Logger::instance().log(::bsonuuid::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::bsonuuid::utils::Logger::instance().log(::bsonuuid::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Arguments are not evaluated unless the condition holds and the level is enabled
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::bsonuuid::utils::Logger::instance().isEnabled(level)) { \
            ::bsonuuid::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
