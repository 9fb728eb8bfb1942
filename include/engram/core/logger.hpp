/*
 * engram - Logger
 */
#ifndef ENGRAM_CORE_LOGGER_HPP
#define ENGRAM_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace engram {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive), def otherwise
LogLevel parse_log_level(const std::string& s, LogLevel def = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (stderr by default). The stream is not owned.
    void set_output(FILE* out);

    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(const char* level_str, const char* fmt, va_list args);

    // Read on every log call from any thread
    std::atomic<LogLevel> level_;
    FILE* out_;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) engram::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  engram::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  engram::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) engram::Logger::instance().error(__VA_ARGS__)

} // namespace engram

#endif // ENGRAM_CORE_LOGGER_HPP
