#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace proxyvisor {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;

void Logger::init(Level threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = threshold;
}

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(Level level, const char * /*file*/, int /*line*/, const std::string &message) {
    if (level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_) {
        return;
    }

    std::ostringstream line;
    line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    line << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    switch (level) {
        case Level::LVL_DEBUG:
            line << " [DEBUG] ";
            break;
        case Level::LVL_INFO:
            line << " [INFO]  ";
            break;
        case Level::LVL_WARN:
            line << " [WARN]  ";
            break;
        case Level::LVL_ERROR:
            line << " [ERROR] ";
            break;
        default:
            break;
    }
    line << message;

    if (sink_) {
        sink_(level, line.str());
        return;
    }

    std::cerr << line.str() << "\n";

    // Flush on error so crash diagnostics are not lost
    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN" || s == "WARNING") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE" || s == "OFF") return Level::LVL_NONE;

    return Level::LVL_INFO;  // Default
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "debug";
        case Level::LVL_INFO:
            return "info";
        case Level::LVL_WARN:
            return "warn";
        case Level::LVL_ERROR:
            return "error";
        case Level::LVL_NONE:
            return "none";
        default:
            return "info";
    }
}

}  // namespace logging
}  // namespace proxyvisor
