/**
 * @file logger.cpp
 * @brief Logger implementation.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#include "bsonuuid/utils/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

namespace bsonuuid {
namespace utils {

namespace {

const char* paddedLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
        default:              return "";
    }
}

}  // namespace

LogLevel parseLogLevel(const std::string& name) {
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO")  return LogLevel::INFO;
    if (name == "WARN")  return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "FATAL") return LogLevel::FATAL;
    if (name == "OFF")   return LogLevel::OFF;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
    , sink_(nullptr)
{}

void Logger::setSink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

std::string Logger::levelName(LogLevel level) {
    std::string name = paddedLevel(level);
    while (!name.empty() && name.back() == ' ') {
        name.pop_back();
    }
    return name;
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message) {
    std::ostringstream oss;

    // Timestamp: [YYYY-MM-DD HH:MM:SS.mmm]
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    oss << "["
        << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count()
        << "] ";

    bool color = colorEnabled_.load(std::memory_order_relaxed);
    if (color) {
        oss << colorCode(level);
    }
    oss << "[" << paddedLevel(level) << "]";
    if (color) {
        oss << "\033[0m";
    }

    oss << " [" << component << "] " << message;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = sink_ ? *sink_ : std::cerr;
    out << oss.str() << std::endl;
}

}  // namespace utils
}  // namespace bsonuuid
