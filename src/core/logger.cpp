#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

#include <ctime>
#include <utility>
#include <unistd.h>

namespace agentmem {

static const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
    }
    return "\033[0m";
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel parse_log_level(const std::string& text, LogLevel fallback) {
    std::string s = to_lower(trim(text));
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info") return LogLevel::INFO;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return fallback;
}

// "void agentmem::MemoryEntryStore::create(const Memory&)" -> {"MemoryEntryStore", "create"}
static std::pair<std::string, std::string> split_pretty_function(const char* pretty_function) {
    std::string signature = pretty_function ? pretty_function : "";

    size_t paren = signature.find('(');
    if (paren != std::string::npos) {
        signature = signature.substr(0, paren);
    }

    size_t space = signature.rfind(' ');
    if (space != std::string::npos) {
        signature = signature.substr(space + 1);
    }

    static const std::string ns = "agentmem::";
    if (starts_with(signature, ns)) {
        signature = signature.substr(ns.size());
    }

    size_t last_colon = signature.rfind("::");
    if (last_colon == std::string::npos) {
        return {"", signature};
    }

    std::string class_name = signature.substr(0, last_colon);
    size_t tmpl = class_name.find('<');
    if (tmpl != std::string::npos) {
        class_name = class_name.substr(0, tmpl);
    }
    return {class_name, signature.substr(last_colon + 2)};
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), out_(stderr), colors_(isatty(STDERR_FILENO) != 0) {}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    if (level < level_) return;
    va_list args;
    va_start(args, fmt);
    write(level, file, line, func, fmt, args);
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

    fprintf(out_, "[%s] %s[%s]%s ", timestamp, color, log_level_name(level), reset);

    if (level_ == LogLevel::DEBUG) {
        auto [class_name, func_name] = split_pretty_function(func);
        if (class_name.empty()) {
            fprintf(out_, "(%s) at %s:%d ", func_name.c_str(), file, line);
        } else {
            fprintf(out_, "(%s::%s) at %s:%d ", class_name.c_str(), func_name.c_str(), file, line);
        }
    }

    vfprintf(out_, fmt, args);
    fprintf(out_, "\n");
    fflush(out_);
}

} // namespace agentmem
