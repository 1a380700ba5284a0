#pragma once
/**
 * @file logger.h
 * @brief Leveled diagnostic logging
 *
 * Process-wide logger writing `[timestamp] [LEVEL] message` lines to stderr.
 * The minimum level defaults to WARNING in release builds and INFO otherwise,
 * and can be overridden with the GEOCLAMP_LOG_LEVEL environment variable
 * (debug, info, warning, error, off).
 */

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace geoclamp::core {

enum class LogLevel : int {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

/**
 * @brief Parse a level name; returns fallback for unknown names
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback);

/**
 * @brief Level name as written in log lines
 */
const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, const std::string& message);
    void set_level(LogLevel level);
    LogLevel level() const;
    bool should_log(LogLevel level) const;

    /// Lines emitted since startup
    std::size_t lines_written() const { return lines_written_.load(std::memory_order_relaxed); }

    template<typename... Args>
    void write(LogLevel level, Args&&... args) {
        if (!should_log(level)) return;
        std::ostringstream oss;
        (oss << ... << args);
        log(level, oss.str());
    }

private:
    static constexpr int DEFAULT_LEVEL =
#ifdef NDEBUG
        static_cast<int>(LogLevel::Warning);
#else
        static_cast<int>(LogLevel::Info);
#endif

    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<int> min_level_{DEFAULT_LEVEL};
    std::atomic<std::size_t> lines_written_{0};
    std::mutex mutex_;
};

} // namespace geoclamp::core

// Arguments are not evaluated when the level is disabled.
#define GEOCLAMP_LOG(level, ...) do { \
    auto& _geoclamp_logger = ::geoclamp::core::Logger::instance(); \
    if (_geoclamp_logger.should_log(level)) { \
        _geoclamp_logger.write(level, __VA_ARGS__); \
    } \
} while (0)

#define GEOCLAMP_LOG_DEBUG(...)   GEOCLAMP_LOG(::geoclamp::core::LogLevel::Debug, __VA_ARGS__)
#define GEOCLAMP_LOG_INFO(...)    GEOCLAMP_LOG(::geoclamp::core::LogLevel::Info, __VA_ARGS__)
#define GEOCLAMP_LOG_WARNING(...) GEOCLAMP_LOG(::geoclamp::core::LogLevel::Warning, __VA_ARGS__)
#define GEOCLAMP_LOG_ERROR(...)   GEOCLAMP_LOG(::geoclamp::core::LogLevel::Error, __VA_ARGS__)
