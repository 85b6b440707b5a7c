#pragma once

#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace telemon {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Parses "debug", "info", "warning"/"warn" or "error"; returns false if unknown
bool parse_log_level(const std::string& name, LogLevel& level);
const char* log_level_name(LogLevel level);

std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

class Logger {
public:
    static void set_level(LogLevel level) { level_ = level; }
    static LogLevel level() { return level_; }

    // Mirror every line into an append-mode file; empty path closes the sink
    static bool set_log_file(const std::string& path);

    // Silence stderr output (the file sink still receives lines)
    static void set_console_enabled(bool enabled) { console_enabled_ = enabled; }

    template<typename... Args>
    static void log(LogLevel level, Args&&... args) {
        if (level < level_) {
            return;
        }
        std::ostringstream oss;
        oss << "[" << format_timestamp(std::chrono::system_clock::now()) << "] "
            << log_level_name(level) << " ";
        ((oss << args), ...);
        write_line(oss.str());
    }

    template<typename... Args>
    static void debug(Args&&... args) { log(LogLevel::Debug, std::forward<Args>(args)...); }

    template<typename... Args>
    static void info(Args&&... args) { log(LogLevel::Info, std::forward<Args>(args)...); }

    template<typename... Args>
    static void warning(Args&&... args) { log(LogLevel::Warning, std::forward<Args>(args)...); }

    template<typename... Args>
    static void error(Args&&... args) { log(LogLevel::Error, std::forward<Args>(args)...); }

private:
    static void write_line(const std::string& line);

    static LogLevel level_;
    static bool console_enabled_;
    static std::ofstream file_;
    static std::mutex mutex_;
};

} // namespace telemon
