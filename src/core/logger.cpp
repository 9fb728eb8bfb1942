#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

namespace engram {

LogLevel parse_log_level(const std::string& s, LogLevel def) {
    std::string v = to_lower(trim(s));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return def;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_.store(level); }

LogLevel Logger::level() const { return level_.load(); }

void Logger::set_output(FILE* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : stderr;
}

void Logger::debug(const char* fmt, ...) {
    if (level_.load() > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl("DEBUG", fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    if (level_.load() > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl("INFO", fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    if (level_.load() > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl("WARN", fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl("ERROR", fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO), out_(stderr) {}

void Logger::log_impl(const char* level_str, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    // One line per call, even with the queue worker logging concurrently
    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(out_, "[%s] [%s] ", timestamp, level_str);
    vfprintf(out_, fmt, args);
    fprintf(out_, "\n");
    fflush(out_);
}

} // namespace engram
