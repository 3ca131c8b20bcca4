#include <convoflow/core/logger.hpp>
#include <cctype>
#include <mutex>

namespace convoflow {

static std::mutex g_log_mutex;

static const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        default: return "\033[0m";
    }
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

// Reduce __PRETTY_FUNCTION__ to "Class::method" (or just "function").
static std::string short_function_name(const char* pretty_function) {
    std::string sig = pretty_function;

    size_t paren = sig.find('(');
    if (paren == std::string::npos) return sig;
    sig = sig.substr(0, paren);

    size_t space = sig.rfind(' ');
    if (space != std::string::npos) {
        sig = sig.substr(space + 1);
    }
    while (!sig.empty() && (sig[0] == '*' || sig[0] == '&')) {
        sig = sig.substr(1);
    }

    const std::string ns = "convoflow::";
    if (sig.compare(0, ns.size(), ns) == 0) {
        sig = sig.substr(ns.size());
    }
    return sig;
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower;
    for (size_t i = 0; i < name.size(); ++i) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
    }
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

#ifdef __GNUC__
__attribute__((visibility("default")))
#endif
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), colors_(true) {}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_colors(bool enabled) { colors_ = enabled; }

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    write(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    write(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    write(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    const char* color = colors_ ? level_color(level) : "";
    const char* reset = colors_ ? "\033[0m" : "";

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level_ == LogLevel::DEBUG) {
        // Source location only at debug verbosity
        std::string where = short_function_name(func);
        fprintf(stderr, "[%s] %s[%s]%s %s(%s)%s at %s%s:%d%s ",
                timestamp, color, level_name(level), reset,
                colors_ ? "\033[36m" : "", where.c_str(), reset,
                colors_ ? "\033[33m" : "", file, line, reset);
    } else {
        fprintf(stderr, "[%s] %s[%s]%s ", timestamp, color, level_name(level), reset);
    }
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    fflush(stderr);
}

} // namespace convoflow
