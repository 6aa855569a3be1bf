#pragma once

#include <cstdarg>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERR
};

std::optional<LogLevel> parse_log_level(std::string_view name);
std::string_view log_level_name(LogLevel level);

// Logs go to stderr since stdout carries the picked line. A log file is
// only written after init() with a directory.
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void init(const std::filesystem::path& log_dir);

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    // Printf-style logging functions

#ifdef NDEBUG
    // Release: no source location
    #if defined(__GNUC__) || defined(__clang__)
    void log(LogLevel level, const char* format, ...) __attribute__((format(printf, 3, 4)));
    #else
    void log(LogLevel level, const char* format, ...);
    #endif
#else
    // Debug: with source location
    #if defined(__GNUC__) || defined(__clang__)
    void log(LogLevel level, const std::source_location& loc, const char* format, ...)
        __attribute__((format(printf, 4, 5)));
    #else
    void log(LogLevel level, const std::source_location& loc, const char* format, ...);
    #endif
#endif

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    void write(const std::string& formatted_msg);
    std::string formatMessage(LogLevel level, const std::string& message);
    std::string getCurrentTimestamp();

    mutable std::mutex mutex_;
    std::unique_ptr<std::ofstream> log_file_;
    LogLevel level_ = LogLevel::WARNING;
    bool initialized_ = false;
};

// Macros handle the source_location injection
#ifdef NDEBUG
    #define LOG_DEBUG(...)   Logger::getInstance().log(LogLevel::DEBUG, __VA_ARGS__)
    #define LOG_INFO(...)    Logger::getInstance().log(LogLevel::INFO, __VA_ARGS__)
    #define LOG_WARNING(...) Logger::getInstance().log(LogLevel::WARNING, __VA_ARGS__)
    #define LOG_ERROR(...)   Logger::getInstance().log(LogLevel::ERR, __VA_ARGS__)
#else
    #define LOG_DEBUG(...)   Logger::getInstance().log(LogLevel::DEBUG, std::source_location::current(), __VA_ARGS__)
    #define LOG_INFO(...)    Logger::getInstance().log(LogLevel::INFO, std::source_location::current(), __VA_ARGS__)
    #define LOG_WARNING(...) Logger::getInstance().log(LogLevel::WARNING, std::source_location::current(), __VA_ARGS__)
    #define LOG_ERROR(...)   Logger::getInstance().log(LogLevel::ERR, std::source_location::current(), __VA_ARGS__)
#endif
