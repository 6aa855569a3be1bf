#include "logger.h"
#include "utility.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

std::optional<LogLevel> parse_log_level(std::string_view name)
{
    if (name == "debug")
        return LogLevel::DEBUG;
    if (name == "info")
        return LogLevel::INFO;
    if (name == "warning" || name == "warn")
        return LogLevel::WARNING;
    if (name == "error")
        return LogLevel::ERR;
    return std::nullopt;
}

std::string_view log_level_name(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:
        return "debug";
    case LogLevel::INFO:
        return "info";
    case LogLevel::WARNING:
        return "warning";
    case LogLevel::ERR:
        return "error";
    }
    return "unknown";
}

void Logger::init(const fs::path &log_dir)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_ || log_dir.empty()) {
        return;
    }

    try {
        fs::create_directories(log_dir);

        auto now = std::chrono::system_clock::now();
        auto time_value = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << platform::path_to_string(log_dir) << "/sift_"
           << std::put_time(std::localtime(&time_value), "%Y%m%d_%H%M%S")
           << ".log";

        log_file_ = std::make_unique<std::ofstream>(ss.str(), std::ios::app);
        if (!log_file_->is_open()) {
            std::cerr << "Warning: Failed to open log file " << ss.str()
                      << std::endl;
            log_file_.reset();
        } else {
            initialized_ = true;
            *log_file_ << formatMessage(LogLevel::INFO, "Logger initialized")
                       << std::endl;
        }
    } catch (const std::exception &e) {
        std::cerr << "Warning: Failed to initialize logger: " << e.what()
                  << std::endl;
    }
}

Logger::~Logger()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_ && log_file_->is_open()) {
        *log_file_ << formatMessage(LogLevel::INFO, "Logger shutting down")
                   << std::endl;
        log_file_->close();
    }
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const
{
    return static_cast<int>(level) >= static_cast<int>(this->level());
}

#ifdef NDEBUG
void Logger::log(LogLevel level, const char *format, ...)
{
    if (!enabled(level)) {
        return;
    }

    va_list args;
    va_start(args, format);

    char buffer[4096];
    vsnprintf(buffer, sizeof(buffer), format, args);

    va_end(args);

    write(formatMessage(level, std::string(buffer)));
}
#else
void Logger::log(LogLevel level, const std::source_location &loc,
                 const char *format, ...)
{
    if (!enabled(level)) {
        return;
    }

    va_list args;
    va_start(args, format);

    char buffer[4096];
    vsnprintf(buffer, sizeof(buffer), format, args);

    va_end(args);

    // Extract just the filename from the full path
    std::string_view file_path = loc.file_name();
    auto last_slash = file_path.find_last_of("/\\");
    std::string_view filename = (last_slash != std::string_view::npos)
                                    ? file_path.substr(last_slash + 1)
                                    : file_path;

    std::ostringstream oss;
    oss << "[" << filename << ":" << loc.line() << " " << loc.function_name()
        << "] " << buffer;

    write(formatMessage(level, oss.str()));
}
#endif

void Logger::write(const std::string &formatted_msg)
{
    std::lock_guard<std::mutex> lock(mutex_);

    fprintf(stderr, "%s\n", formatted_msg.c_str());
    fflush(stderr);

    if (log_file_ && log_file_->is_open()) {
        *log_file_ << formatted_msg << std::endl;
    }
}

std::string Logger::formatMessage(LogLevel level, const std::string &message)
{
    std::stringstream ss;
    ss << "[" << getCurrentTimestamp() << "] " << "[" << log_level_name(level)
       << "] " << message;
    return ss.str();
}

std::string Logger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_value = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_value), "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}
