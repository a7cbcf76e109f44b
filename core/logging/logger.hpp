#pragma once

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace proxyvisor {
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
    // Receives every line that passes the threshold (already formatted, no trailing newline)
    using Sink = std::function<void(Level, const std::string &)>;

    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Redirect output away from stderr; an empty sink restores stderr
    static void set_sink(Sink sink);

private:
    static Level threshold_;
    static std::mutex mutex_;
    static Sink sink_;
};

// Helpers for config parsing and display
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace proxyvisor

#define PV_LOG_INTERNAL(level, msg)                                              \
    do {                                                                         \
        std::stringstream pv_log_ss;                                             \
        pv_log_ss << msg;                                                        \
        proxyvisor::logging::Logger::log(level, __FILE__, __LINE__, pv_log_ss.str()); \
    } while (0)

#define LOG_DEBUG(msg) PV_LOG_INTERNAL(proxyvisor::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) PV_LOG_INTERNAL(proxyvisor::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) PV_LOG_INTERNAL(proxyvisor::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) PV_LOG_INTERNAL(proxyvisor::logging::Level::LVL_ERROR, msg)
