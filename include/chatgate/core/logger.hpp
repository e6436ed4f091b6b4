#ifndef CHATGATE_CORE_LOGGER_HPP
#define CHATGATE_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace chatgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Process-wide line logger. Lines are written to stderr as
//   [2026-01-01 12:00:00] [INFO] session.open id=support-a
// and never interleave between threads.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Accepts "debug", "info", "warn" or "error"; anything else keeps the current level
    bool set_level(const std::string& name);

    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log_impl(const char* level_str, const char* fmt, va_list args);

    LogLevel level_;
    std::mutex write_mutex_;
};

#define LOG_DEBUG(...) chatgate::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  chatgate::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  chatgate::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) chatgate::Logger::instance().error(__VA_ARGS__)

} // namespace chatgate

#endif // CHATGATE_CORE_LOGGER_HPP
