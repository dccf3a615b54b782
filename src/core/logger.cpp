#include <notevault/core/logger.hpp>
#include <notevault/core/utils.hpp>

#include <unistd.h>

namespace notevault {

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

// "bool notevault::guard::reject_null_bytes(const string&)" -> {"guard", "reject_null_bytes"}
static std::pair<std::string, std::string> extract_scope_and_function(const char* pretty_function) {
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
    std::string scope = (space_pos != std::string::npos)
        ? before_last_colon.substr(space_pos + 1)
        : before_last_colon;

    size_t template_pos = scope.find('<');
    if (template_pos != std::string::npos) {
        scope = scope.substr(0, template_pos);
    }
    if (!scope.empty() && scope[0] == '*') {
        scope = scope.substr(1);
    }
    if (starts_with(scope, "notevault::")) {
        scope = scope.substr(11);
    }

    return {scope, func_name};
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") {
        out = LogLevel::DEBUG;
    } else if (lower == "info") {
        out = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::WARN;
    } else if (lower == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_stream(FILE* stream) {
    stream_ = stream ? stream : stderr;
    colors_ = isatty(fileno(stream_)) != 0;
}

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
    : level_(LogLevel::INFO)
    , stream_(stderr)
    , colors_(isatty(fileno(stderr)) != 0) {}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    const char* color = colors_ ? get_color_code(level) : "";
    const char* reset = colors_ ? "\033[0m" : "";
    const char* level_str = get_level_str(level);

    if (level_ == LogLevel::DEBUG) {
        auto [scope, func_name] = extract_scope_and_function(func);
        const char* func_color = colors_ ? "\033[36m" : "";
        const char* location_color = colors_ ? "\033[33m" : "";
        if (!scope.empty()) {
            fprintf(stream_, "[%s] %s[%s]%s %s(%s::%s)%s at %s%s:%d%s ",
                    timestamp, color, level_str, reset, func_color, scope.c_str(), func_name.c_str(),
                    reset, location_color, file, line, reset);
        } else {
            fprintf(stream_, "[%s] %s[%s]%s %s(%s)%s at %s%s:%d%s ",
                    timestamp, color, level_str, reset, func_color, func_name.c_str(),
                    reset, location_color, file, line, reset);
        }
    } else {
        fprintf(stream_, "[%s] %s[%s]%s ", timestamp, color, level_str, reset);
    }
    vfprintf(stream_, fmt, args);
    fprintf(stream_, "\n");
    fflush(stream_);
}

} // namespace notevault
