#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace rfaccess {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Logger instance handed to every component at construction.
// There is no process-wide logger; a null handle disables logging.
class Logger {
public:
    explicit Logger(Level threshold = Level::LVL_INFO, std::ostream &out = std::cerr);

    void log(Level level, const char *file, int line, const std::string &message);
    void set_level(Level level);
    Level level() const;
    bool enabled(Level level) const;

private:
    Level threshold_;
    std::ostream &out_;
    mutable std::mutex mutex_;
};

using LoggerPtr = std::shared_ptr<Logger>;

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string &level_str);
bool is_valid_level(const std::string &level_str);

}  // namespace logging
}  // namespace rfaccess

// Macro macros to handle string building
#define LOG_INTERNAL(logger, level, msg)                                    \
    do {                                                                    \
        const auto &rfaccess_log_target_ = (logger);                        \
        if (rfaccess_log_target_ && rfaccess_log_target_->enabled(level)) { \
            std::stringstream ss;                                           \
            ss << msg;                                                      \
            rfaccess_log_target_->log(level, __FILE__, __LINE__, ss.str()); \
        }                                                                   \
    } while (0)

#define LOG_DEBUG(logger, msg) LOG_INTERNAL(logger, rfaccess::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(logger, msg) LOG_INTERNAL(logger, rfaccess::logging::Level::LVL_INFO, msg)
#define LOG_WARN(logger, msg) LOG_INTERNAL(logger, rfaccess::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(logger, msg) LOG_INTERNAL(logger, rfaccess::logging::Level::LVL_ERROR, msg)
