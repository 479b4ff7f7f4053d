#include "../include/logger.hpp"
#include <stdarg.h>
#include <string.h>
#include <chrono>
#include <cstdio>


Logger::Level Logger::min_level_ = Logger::INFO;
bool Logger::flush_on_write_ = true;

// Uptime reference for the timestamp column; the board has no RTC by default
static const std::chrono::steady_clock::time_point kLogEpoch = std::chrono::steady_clock::now();

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    if (strcmp(name.c_str(), "DEBUG") == 0) return Logger::DEBUG;
    if (strcmp(name.c_str(), "INFO") == 0) return Logger::INFO;
    if (strcmp(name.c_str(), "WARN") == 0) return Logger::WARN;
    if (strcmp(name.c_str(), "ERROR") == 0) return Logger::ERROR;
    return fallback;
}

void Logger::begin(const LoggingConfig& cfg) {
    min_level_ = Logger::INFO;
    if (!cfg.log_level.empty()) {
        min_level_ = parseLevel(cfg.log_level, Logger::INFO);
    }
    flush_on_write_ = cfg.flush_on_write;
}

void Logger::write_log(Level level, const char* fmt, va_list args) {
    if (level < min_level_) return;
    char buf[256];
    (void)vsnprintf(buf, sizeof(buf), fmt, args);
    const char* level_str = "INFO";
    switch (level) {
        case Logger::DEBUG: level_str = "DEBUG"; break;
        case Logger::INFO:  level_str = "INFO"; break;
        case Logger::WARN:  level_str = "WARN"; break;
        case Logger::ERROR: level_str = "ERROR"; break;
    }
    // [uptime HH:MM:SS.mmm] [LEVEL] message
    unsigned long ms = (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - kLogEpoch).count();
    unsigned long seconds = ms / 1000;
    unsigned long minutes = seconds / 60;
    unsigned long hours = minutes / 60;
    char time_buf[32];
    snprintf(time_buf, sizeof(time_buf), "%02lu:%02lu:%02lu.%03lu",
             hours, minutes % 60, seconds % 60, ms % 1000);

    printf("[%s] [%s] %s\n", time_buf, level_str, buf);
    if (flush_on_write_) fflush(stdout);
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
