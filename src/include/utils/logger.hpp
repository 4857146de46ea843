#pragma once
#include <string>
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace dp_ledger {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

LogLevel string_to_log_level(const std::string& str);
std::string log_level_to_string(LogLevel level);

class Logger {
public:
    static Logger& get();
    void set_level(LogLevel level);
    LogLevel get_level() const;
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
private:
    Logger();
    ~Logger() = default;
    void log(LogLevel level, const char* fmt, va_list args);
    LogLevel level_ = LogLevel::INFO;
    mutable std::mutex mutex_;
};

} // namespace dp_ledger
