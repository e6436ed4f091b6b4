#include <chatgate/core/logger.hpp>

namespace chatgate {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO) {}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

bool Logger::set_level(const std::string& name) {
    if (name == "debug") {
        level_ = LogLevel::DEBUG;
    } else if (name == "info") {
        level_ = LogLevel::INFO;
    } else if (name == "warn" || name == "warning") {
        level_ = LogLevel::WARN;
    } else if (name == "error") {
        level_ = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

#define CHATGATE_LOG_AT(lvl, tag)          \
    if (level_ > (lvl)) return;            \
    va_list args;                          \
    va_start(args, fmt);                   \
    log_impl(tag, fmt, args);              \
    va_end(args)

void Logger::debug(const char* fmt, ...) { CHATGATE_LOG_AT(LogLevel::DEBUG, "DEBUG"); }

void Logger::info(const char* fmt, ...) { CHATGATE_LOG_AT(LogLevel::INFO, "INFO"); }

void Logger::warn(const char* fmt, ...) { CHATGATE_LOG_AT(LogLevel::WARN, "WARN"); }

void Logger::error(const char* fmt, ...) { CHATGATE_LOG_AT(LogLevel::ERROR, "ERROR"); }

#undef CHATGATE_LOG_AT

void Logger::log_impl(const char* level_str, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    char line[2048];
    vsnprintf(line, sizeof(line), fmt, args);

    std::lock_guard<std::mutex> lock(write_mutex_);
    fprintf(stderr, "[%s] [%s] %s\n", timestamp, level_str, line);
    fflush(stderr);
}

} // namespace chatgate
