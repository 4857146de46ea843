#include "utils/logger.hpp"
#include "core/errors.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdarg>

namespace dp_ledger {

namespace {
    const char* level_strings[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};
    const char* color_codes[] = {"\033[0;90m", "\033[0;36m", "\033[0;32m", "\033[0;33m", "\033[0;31m"};
    const char* reset_code = "\033[0m";
}

LogLevel string_to_log_level(const std::string& str) {
    if (str == "trace") return LogLevel::TRACE;
    if (str == "debug") return LogLevel::DEBUG;
    if (str == "info")  return LogLevel::INFO;
    if (str == "warn")  return LogLevel::WARN;
    if (str == "error") return LogLevel::ERROR;
    throw ConfigurationError("Unknown log level: " + str);
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        default:              return "info";
    }
}

Logger::Logger() {
    std::setvbuf(stdout, nullptr, _IONBF, 0);
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::WARN, fmt, args);
    va_end(args);
}

void Logger::log(LogLevel level, const char* fmt, va_list args) {
    // Lines from concurrent spenders must not interleave
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ > level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::printf("[%02d:%02d:%02d] ", local_tm.tm_hour, local_tm.tm_min, local_tm.tm_sec);

    std::printf("%s%s%s: ", color_codes[static_cast<int>(level)],
               level_strings[static_cast<int>(level)], reset_code);

    std::vprintf(fmt, args);
    std::printf("\n");
}

} // namespace dp_ledger
