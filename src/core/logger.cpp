/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "geoclamp/core/logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace geoclamp::core {

LogLevel parse_log_level(const std::string& name, LogLevel fallback)
{
    std::string v(name);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warning;
    if (v == "error") return LogLevel::Error;
    if (v == "off" || v == "none") return LogLevel::Off;
    return fallback;
}

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF  ";
    }
    return "?????";
}

Logger& Logger::instance()
{
    static Logger instance;
    return instance;
}

Logger::Logger()
{
    if (const char* env = std::getenv("GEOCLAMP_LOG_LEVEL")) {
        set_level(parse_log_level(env, static_cast<LogLevel>(DEFAULT_LEVEL)));
    }
}

void Logger::log(LogLevel level, const std::string& message)
{
    if (!should_log(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    // Format: [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message
    std::ostringstream line;
    line << "["
         << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count()
         << "] [" << log_level_name(level) << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line.str();
    lines_written_.fetch_add(1, std::memory_order_relaxed);
}

void Logger::set_level(LogLevel level)
{
    min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() const
{
    return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
}

bool Logger::should_log(LogLevel level) const
{
    return level != LogLevel::Off &&
           static_cast<int>(level) >= min_level_.load(std::memory_order_relaxed);
}

} // namespace geoclamp::core
