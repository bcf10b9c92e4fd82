#ifndef shotguard_CORE_LOGGER_HPP
#define shotguard_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace shotguard {

#ifdef __GNUC__
#  define SHOTGUARD_LOGGER_API __attribute__((visibility("default")))
#else
#  define SHOTGUARD_LOGGER_API
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Unknown names leave `out` untouched and return false.
bool parse_log_level(const std::string& name, LogLevel& out);

class SHOTGUARD_LOGGER_API Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (default: stderr). Colors are only emitted for a tty.
    void set_output(FILE* out);

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    FILE* out_;
};

#define LOG_DEBUG(...) shotguard::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  shotguard::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  shotguard::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) shotguard::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace shotguard

#endif // shotguard_CORE_LOGGER_HPP
