#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace corral {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);

    // Redirect output (nullptr restores std::cerr). Caller keeps the stream alive.
    static void set_sink(std::ostream* sink);

private:
    static std::atomic<Level> threshold_;
    static std::ostream* sink_;
    static std::mutex mutex_;
};

// Config parsing helpers
Level string_to_level(const std::string& level_str);
std::string level_to_string(Level level);

} // namespace logging
} // namespace corral

// Macros build the message with a stringstream so call sites can chain <<
#define LOG_INTERNAL(level, msg) \
    do { \
        if (corral::logging::Logger::enabled(level)) { \
            std::stringstream ss; \
            ss << msg; \
            corral::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(corral::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(corral::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(corral::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(corral::logging::Level::LVL_ERROR, msg)
