/*
 * notevault C++17 - Logger
 *
 * printf-style leveled logging. Everything goes to stderr: stdout is
 * reserved for the JSON-RPC stream the MCP client reads.
 */
#ifndef notevault_CORE_LOGGER_HPP
#define notevault_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace notevault {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (tests capture into a tmpfile). nullptr restores stderr.
    void set_stream(FILE* stream);

    void debug(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void info(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void warn(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void error(const char* file, int line, const char* func, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    FILE* stream_;
    bool colors_;
};

// Convenience macros
#define LOG_DEBUG(...) notevault::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  notevault::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  notevault::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) notevault::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace notevault

#endif // notevault_CORE_LOGGER_HPP
