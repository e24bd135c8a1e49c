#include "logger.h"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <cctype>

namespace {

std::string lowercase(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

Logger::Logger()
    : min_log_level_(LogLevel::INFO)
    , console_output_enabled_(true)
    , file_output_enabled_(false)
    , log_file_(nullptr) {
}

Logger::~Logger() {
    is_destructing_ = true;
    if (log_file_ && log_file_->is_open()) {
        log_file_->close();
    }
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_log_level_ = level;
}

LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return min_log_level_;
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lower = lowercase(name);

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return LogLevel::INFO;
}

bool Logger::is_level_name(const std::string& name) {
    std::string lower = lowercase(name);
    return lower == "info" || parse_level(lower) != LogLevel::INFO;
}

void Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (log_file_ && log_file_->is_open()) {
        log_file_->close();
    }

    log_filename_ = filename;
    log_file_ = std::make_unique<std::ofstream>(filename, std::ios::app);

    if (log_file_->is_open()) {
        file_output_enabled_ = true;
        *log_file_ << "\n=== Courier log opened at " << get_timestamp() << " ===\n";
        log_file_->flush();
    } else {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        file_output_enabled_ = false;
    }
}

void Logger::set_console_output(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_enabled_ = enable;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level >= get_log_level()) {
        write_log(level, message);
    }
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "INFO ";
}

void Logger::write_log(LogLevel level, const std::string& message) {
    // Static destruction order: late log calls are dropped
    if (is_destructing_) {
        return;
    }

    std::lock_guard<std::mutex> lock(log_mutex_);

    std::string line = "[" + get_timestamp() + "] [" + level_to_string(level) + "] " + message;

    if (console_output_enabled_) {
        // stdout stays clean for CLI results when only warnings are printed
        if (level >= LogLevel::WARN) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }

    if (file_output_enabled_ && log_file_ && log_file_->is_open()) {
        *log_file_ << line << "\n";
        log_file_->flush();
    }
}
