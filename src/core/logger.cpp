#include <halbox/core/logger.hpp>

#include <unistd.h>

namespace halbox {

static const char* get_color_code(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m";
    }
}

static const char* get_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

static std::pair<std::string, std::string> extract_class_and_function(const char* pretty_function) {
    std::string pf = pretty_function;

    size_t paren_pos = pf.find('(');
    if (paren_pos == std::string::npos) {
        return {"", ""};
    }

    std::string signature = pf.substr(0, paren_pos);

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        size_t space_pos = signature.rfind(' ');
        std::string func_name = (space_pos != std::string::npos) ? signature.substr(space_pos + 1) : signature;
        return {"", func_name};
    }

    std::string func_name = signature.substr(last_colon + 2);

    std::string before_last_colon = signature.substr(0, last_colon);
    size_t space_pos = before_last_colon.rfind(' ');
    std::string class_name = (space_pos != std::string::npos)
        ? before_last_colon.substr(space_pos + 1)
        : before_last_colon;

    size_t template_pos = class_name.find('<');
    if (template_pos != std::string::npos) {
        class_name = class_name.substr(0, template_pos);
    }
    if (!class_name.empty() && class_name[0] == '*') {
        class_name = class_name.substr(1);
    }

    // Free functions in the project namespace read better without it
    static const std::string ns = "halbox::";
    if (class_name.compare(0, ns.size(), ns) == 0) {
        class_name = class_name.substr(ns.size());
    } else if (class_name == "halbox") {
        class_name.clear();
    }

    return {class_name, func_name};
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "warn" || name == "warning") { out = LogLevel::WARN; return true; }
    if (name == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_color(bool enabled) { color_ = enabled; }

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

Logger::Logger()
    : level_(LogLevel::WARN)
    , color_(isatty(STDERR_FILENO) == 1)
{}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    const char* color = color_ ? get_color_code(level) : "";
    const char* reset = color_ ? "\033[0m" : "";
    const char* func_color = color_ ? "\033[36m" : "";
    const char* location_color = color_ ? "\033[33m" : "";
    const char* level_str = get_level_str(level);

    // One buffer per line so concurrent callers don't interleave mid-line
    char prefix[512];
    if (level_ == LogLevel::DEBUG) {
        auto [class_name, func_name] = extract_class_and_function(func);
        if (!class_name.empty()) {
            snprintf(prefix, sizeof(prefix), "[%s] %s[%s]%s %s(%s::%s)%s at %s%s:%d%s ",
                     timestamp, color, level_str, reset, func_color, class_name.c_str(),
                     func_name.c_str(), reset, location_color, file, line, reset);
        } else {
            snprintf(prefix, sizeof(prefix), "[%s] %s[%s]%s %s(%s)%s at %s%s:%d%s ",
                     timestamp, color, level_str, reset, func_color, func_name.c_str(),
                     reset, location_color, file, line, reset);
        }
    } else {
        snprintf(prefix, sizeof(prefix), "[%s] %s[%s]%s ", timestamp, color, level_str, reset);
    }

    char message[4096];
    vsnprintf(message, sizeof(message), fmt, args);
    fprintf(stderr, "%s%s\n", prefix, message);
    fflush(stderr);
}

} // namespace halbox
