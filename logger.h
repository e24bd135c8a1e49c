#pragma once

#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <chrono>
#include <sstream>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

/// @brief Process-wide leveled logger
/// Lines are "[YYYY-mm-dd HH:MM:SS.mmm] [LEVEL] message". WARN and above go
/// to stderr, lower levels to stdout; an optional file sink gets every line.
class Logger {
public:
    Logger();
    ~Logger();

    // Configuration
    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;
    void set_log_file(const std::string& filename);
    void set_console_output(bool enable);

    /// @brief "trace", "debug", "info", "warn"/"warning", "error", "fatal" (case-insensitive)
    /// Unknown names map to INFO
    static LogLevel parse_level(const std::string& name);
    static bool is_level_name(const std::string& name);

    // Logging methods
    void log(LogLevel level, const std::string& message);
    void trace(const std::string& message) { log(LogLevel::TRACE, message); }
    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }
    void fatal(const std::string& message) { log(LogLevel::FATAL, message); }

    /// @brief Log with "{}" placeholders filled from args in order
    template<typename... Args>
    void log_fmt(LogLevel level, const std::string& pattern, const Args&... args);

    /// @brief Replace successive "{}" with args; surplus args are dropped
    template<typename... Args>
    static std::string format(const std::string& pattern, const Args&... args);

    // Singleton access
    static Logger& instance();

private:
    LogLevel min_log_level_;
    bool console_output_enabled_;
    bool file_output_enabled_;
    std::unique_ptr<std::ofstream> log_file_;
    std::string log_filename_;
    mutable std::mutex log_mutex_;
    bool is_destructing_ = false;

    std::string get_timestamp() const;
    static const char* level_to_string(LogLevel level);
    void write_log(LogLevel level, const std::string& message);

    template<typename T>
    static void substitute(std::string& text, size_t& pos, const T& value);
};

template<typename T>
void Logger::substitute(std::string& text, size_t& pos, const T& value) {
    size_t at = text.find("{}", pos);
    if (at == std::string::npos) {
        return;
    }
    std::ostringstream oss;
    oss << value;
    std::string rendered = oss.str();
    text.replace(at, 2, rendered);
    pos = at + rendered.size();
}

template<typename... Args>
std::string Logger::format(const std::string& pattern, const Args&... args) {
    std::string text = pattern;
    size_t pos = 0;
    (substitute(text, pos, args), ...);
    return text;
}

template<typename... Args>
void Logger::log_fmt(LogLevel level, const std::string& pattern, const Args&... args) {
    if (level >= get_log_level()) {
        write_log(level, format(pattern, args...));
    }
}

// Convenience macros for global logger access
#define LOG_TRACE(msg) Logger::instance().trace(msg)
#define LOG_DEBUG(msg) Logger::instance().debug(msg)
#define LOG_INFO(msg) Logger::instance().info(msg)
#define LOG_WARN(msg) Logger::instance().warn(msg)
#define LOG_ERROR(msg) Logger::instance().error(msg)
#define LOG_FATAL(msg) Logger::instance().fatal(msg)

#define LOG_DEBUG_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::DEBUG, fmt, __VA_ARGS__)
#define LOG_INFO_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::INFO, fmt, __VA_ARGS__)
#define LOG_WARN_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::WARN, fmt, __VA_ARGS__)
#define LOG_ERROR_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::ERROR, fmt, __VA_ARGS__)
