#include "bags/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace bags {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

bool Logger::initialize(const std::string& log_file_path, Level min_level,
                        bool console_output, size_t max_file_size_mb) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (log_file_.is_open()) {
        log_file_.close();
    }

    log_file_path_ = log_file_path;
    min_level_ = min_level;
    console_output_ = console_output;
    max_file_size_bytes_ = max_file_size_mb * 1024 * 1024;
    current_file_size_ = 0;

    std::error_code ec;
    std::filesystem::path log_path(log_file_path_);
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
        if (ec) {
            std::cerr << "Logger: cannot create " << log_path.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    log_file_.open(log_file_path_, std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "Logger: Failed to open log file: " << log_file_path_ << std::endl;
        return false;
    }

    auto size = std::filesystem::file_size(log_path, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(size);

    initialized_ = true;
    writeLocked(Level::INFO, "Logger initialized: level=" + levelToString(min_level_) +
                ", file=" + log_file_path_, nullptr, 0, nullptr);
    return true;
}

void Logger::shutdown() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }
    try {
        writeLocked(Level::INFO, "Logger shutting down", nullptr, 0, nullptr);
    } catch (const std::exception& e) {
        std::cerr << "Logger shutdown error: " << e.what() << std::endl;
    }
    initialized_ = false;
    log_file_.close();
}

std::string Logger::getLogFilePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_file_path_;
}

void Logger::log(Level level, const std::string& message,
                 const char* file, int line, const char* function) noexcept {
    if (level < min_level_) {
        return;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return;
        }
        writeLocked(level, message, file, line, function);
    } catch (const std::exception& e) {
        std::cerr << "Logger error (" << e.what() << ") while writing: " << message << std::endl;
    }
}

void Logger::writeLocked(Level level, const std::string& message,
                         const char* file, int line, const char* function) {
    std::string formatted = formatMessage(level, message, file, line, function);

    if (log_file_.is_open()) {
        log_file_ << formatted << '\n';
        log_file_.flush();
        current_file_size_ += formatted.size() + 1;
    }
    if (console_output_) {
        std::cerr << formatted << std::endl;
    }

    rotateLogFileIfNeeded();
}

void Logger::logException(const std::exception& e, const std::string& context,
                          const char* file, int line, const char* function) noexcept {
    std::string msg = std::string("Exception caught: ") + e.what();
    if (!context.empty()) {
        msg += " (Context: " + context + ")";
    }
    log(Level::ERROR, msg, file, line, function);
}

std::string Logger::levelToString(Level level) noexcept {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

Logger::Level Logger::stringToLevel(const std::string& level_str) noexcept {
    std::string lower = level_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::TRACE;
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info")  return Level::INFO;
    if (lower == "warn")  return Level::WARN;
    if (lower == "error") return Level::ERROR;
    if (lower == "fatal") return Level::FATAL;

    return Level::INFO;
}

std::unique_ptr<Logger::PerformanceTimer> Logger::createTimer(const std::string& operation_name) {
    return std::make_unique<PerformanceTimer>(operation_name);
}

std::string Logger::formatMessage(Level level, const std::string& message,
                                  const char* file, int line, const char* function) const {
    std::ostringstream formatted;
    formatted << "[" << getCurrentTimestamp() << "] ";
    formatted << "[" << std::setw(5) << levelToString(level) << "] ";
    formatted << "[" << std::this_thread::get_id() << "] ";
    formatted << message;

    // Source location only for debug/trace
    if (level <= Level::DEBUG && file && function) {
        formatted << " (" << extractFileName(file) << ":" << line << " in " << function << ")";
    }
    return formatted.str();
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream timestamp;
    timestamp << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return timestamp.str();
}

void Logger::rotateLogFileIfNeeded() {
    if (current_file_size_ < max_file_size_bytes_) {
        return;
    }

    log_file_.close();

    std::error_code ec;
    const std::string backup_path = log_file_path_ + ".1";
    std::filesystem::remove(backup_path, ec);
    std::filesystem::rename(log_file_path_, backup_path, ec);
    if (ec) {
        std::cerr << "Log rotation error: " << ec.message() << std::endl;
    }

    log_file_.open(log_file_path_, std::ios::app);
    current_file_size_ = 0;
}

std::string Logger::extractFileName(const char* file_path) {
    if (!file_path) {
        return "unknown_file";
    }
    std::string path_str(file_path);
    size_t last_slash = path_str.find_last_of("/\\");
    if (last_slash != std::string::npos && last_slash + 1 < path_str.length()) {
        return path_str.substr(last_slash + 1);
    }
    return path_str;
}

Logger::PerformanceTimer::PerformanceTimer(const std::string& operation_name)
    : operation_name_(operation_name)
    , start_time_(std::chrono::steady_clock::now()) {
}

Logger::PerformanceTimer::~PerformanceTimer() {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
    Logger::getInstance().debug("Performance: " + operation_name_ + " took " +
                                std::to_string(elapsed.count()) + " ms");
}

} // namespace bags
