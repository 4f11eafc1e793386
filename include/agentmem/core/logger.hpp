/*
 * agentmem C++ - Logger
 *
 * Process-wide leveled logger. Messages go to stderr with a timestamp;
 * at DEBUG level the calling class::function and file:line are included.
 */
#ifndef agentmem_CORE_LOGGER_HPP
#define agentmem_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <cstdarg>

namespace agentmem {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Map "debug", "info", "warn"/"warning", "error" (any case) to a level.
LogLevel parse_log_level(const std::string& text, LogLevel fallback = LogLevel::INFO);
const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void write(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    FILE* out_;
    bool colors_;
};

#define LOG_DEBUG(...) agentmem::Logger::instance().log(agentmem::LogLevel::DEBUG, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  agentmem::Logger::instance().log(agentmem::LogLevel::INFO, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  agentmem::Logger::instance().log(agentmem::LogLevel::WARN, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) agentmem::Logger::instance().log(agentmem::LogLevel::ERROR, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace agentmem

#endif // agentmem_CORE_LOGGER_HPP
