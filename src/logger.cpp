#include "../include/logger.hpp"
#include <chrono>
#include <errno.h>
#include <string.h>
#include <strings.h>
#include <time.h>


Logger::Level Logger::min_level_ = Logger::INFO;
std::string Logger::log_file_;
std::FILE* Logger::file_ = nullptr;
bool Logger::flush_on_write_ = true;

Logger::Level Logger::levelFromString(const std::string& name, Level fallback) {
    if (strcasecmp(name.c_str(), "DEBUG") == 0) return Logger::DEBUG;
    if (strcasecmp(name.c_str(), "INFO") == 0) return Logger::INFO;
    if (strcasecmp(name.c_str(), "WARN") == 0 || strcasecmp(name.c_str(), "WARNING") == 0) return Logger::WARN;
    if (strcasecmp(name.c_str(), "ERROR") == 0) return Logger::ERROR;
    return fallback;
}

void Logger::begin(const LoggingConfig& cfg) {
    min_level_ = levelFromString(cfg.log_level, Logger::INFO);
    flush_on_write_ = cfg.flush_on_write;
    shutdown();
    log_file_ = cfg.log_file;
    if (!log_file_.empty()) {
        file_ = std::fopen(log_file_.c_str(), "a");
        if (!file_) {
            // Still usable on stderr
            std::fprintf(stderr, "Logger: cannot open %s: %s\n", log_file_.c_str(), strerror(errno));
        }
    }
}

void Logger::setLevel(Level level) { min_level_ = level; }

void Logger::write_log(Level level, const char* fmt, va_list args) {
    if (level < min_level_) return;
    char buf[512];
    (void)vsnprintf(buf, sizeof(buf), fmt, args);
    const char* level_str = "INFO";
    switch (level) {
        case Logger::DEBUG: level_str = "DEBUG"; break;
        case Logger::INFO:  level_str = "INFO"; break;
        case Logger::WARN:  level_str = "WARN"; break;
        case Logger::ERROR: level_str = "ERROR"; break;
    }
    // [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message
    auto now = std::chrono::system_clock::now();
    time_t secs = std::chrono::system_clock::to_time_t(now);
    long ms = (long)(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    struct tm local;
    localtime_r(&secs, &local);
    char time_buf[32];
    size_t n = strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &local);
    snprintf(time_buf + n, sizeof(time_buf) - n, ".%03ld", ms);

    std::fprintf(stderr, "[%s] [%s] %s\n", time_buf, level_str, buf);

    if (file_) {
        std::fprintf(file_, "[%s] [%s] %s\n", time_buf, level_str, buf);
        if (flush_on_write_) std::fflush(file_);
    }
}

void Logger::log(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(level, fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(ERROR, fmt, args);
    va_end(args);
}

void Logger::flush() {
    std::fflush(stderr);
    if (file_) std::fflush(file_);
}

void Logger::shutdown() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}
