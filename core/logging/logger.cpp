#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace rfaccess {
namespace logging {

Logger::Logger(Level threshold, std::ostream &out) : threshold_(threshold), out_(out) {}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::enabled(Level level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != Level::LVL_NONE && level >= threshold_;
}

void Logger::log(Level level, const char *, int, const std::string &message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level == Level::LVL_NONE || level < threshold_) {
        return;
    }

    // Timestamp
    out_ << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out_ << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    // Level
    switch (level) {
        case Level::LVL_DEBUG: out_ << " [DEBUG] "; break;
        case Level::LVL_INFO:  out_ << " [INFO]  "; break;
        case Level::LVL_WARN:  out_ << " [WARN]  "; break;
        case Level::LVL_ERROR: out_ << " [ERROR] "; break;
        default: break;
    }

    // Message
    out_ << message << "\n";

    if (level >= Level::LVL_ERROR) {
        out_ << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN" || s == "WARNING") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;  // Default
}

bool is_valid_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s == "DEBUG" || s == "INFO" || s == "WARN" || s == "WARNING" || s == "ERROR" || s == "NONE";
}

}  // namespace logging
}  // namespace rfaccess
