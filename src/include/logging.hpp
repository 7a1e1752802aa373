#pragma once
#include <cstdarg>
#include <cstdio>
#include <mutex>

enum class LogLevel { TRACE = 0, DEBUG, INFO, WARN, ERROR };

// Process-wide logger writing timestamped lines to stderr.
class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel lvl) const { return lvl >= level_; }
    void log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    const char* level_str(LogLevel lvl);
};

#define LOG_TRACE(...) Logger::instance().log(LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log(LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  Logger::instance().log(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  Logger::instance().log(LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) Logger::instance().log(LogLevel::ERROR, __VA_ARGS__)
