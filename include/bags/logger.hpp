#pragma once
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace bags {

/**
 * Process-wide append-only log.
 * The terminal belongs to the UI while it runs, so console output defaults to off
 * and every user-visible error is written here in full with a timestamp.
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        FATAL = 5
    };

    static Logger& getInstance();

    // Opens (or creates) the log file in append mode
    bool initialize(const std::string& log_file_path, Level min_level = Level::INFO,
                    bool console_output = false, size_t max_file_size_mb = 5);

    void shutdown() noexcept;

    void log(Level level, const std::string& message,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) noexcept;

    void trace(const std::string& message, const char* file = __builtin_FILE(),
               int line = __builtin_LINE(), const char* function = __builtin_FUNCTION()) noexcept {
        log(Level::TRACE, message, file, line, function);
    }

    void debug(const std::string& message, const char* file = __builtin_FILE(),
               int line = __builtin_LINE(), const char* function = __builtin_FUNCTION()) noexcept {
        log(Level::DEBUG, message, file, line, function);
    }

    void info(const std::string& message, const char* file = __builtin_FILE(),
              int line = __builtin_LINE(), const char* function = __builtin_FUNCTION()) noexcept {
        log(Level::INFO, message, file, line, function);
    }

    void warn(const std::string& message, const char* file = __builtin_FILE(),
              int line = __builtin_LINE(), const char* function = __builtin_FUNCTION()) noexcept {
        log(Level::WARN, message, file, line, function);
    }

    void error(const std::string& message, const char* file = __builtin_FILE(),
               int line = __builtin_LINE(), const char* function = __builtin_FUNCTION()) noexcept {
        log(Level::ERROR, message, file, line, function);
    }

    void fatal(const std::string& message, const char* file = __builtin_FILE(),
               int line = __builtin_LINE(), const char* function = __builtin_FUNCTION()) noexcept {
        log(Level::FATAL, message, file, line, function);
    }

    void setLevel(Level min_level) noexcept { min_level_ = min_level; }
    Level getLevel() const noexcept { return min_level_; }

    void setConsoleOutput(bool enable) noexcept { console_output_ = enable; }
    bool getConsoleOutput() const noexcept { return console_output_; }

    std::string getLogFilePath() const;

    static std::string levelToString(Level level) noexcept;
    static Level stringToLevel(const std::string& level_str) noexcept;

    // Logs the elapsed time of a scope at DEBUG level
    struct PerformanceTimer {
        explicit PerformanceTimer(const std::string& operation_name);
        ~PerformanceTimer();

    private:
        std::string operation_name_;
        std::chrono::steady_clock::time_point start_time_;
    };

    std::unique_ptr<PerformanceTimer> createTimer(const std::string& operation_name);

    void logException(const std::exception& e, const std::string& context = "",
                      const char* file = __builtin_FILE(),
                      int line = __builtin_LINE(),
                      const char* function = __builtin_FUNCTION()) noexcept;

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    std::ofstream log_file_;
    std::string log_file_path_;
    Level min_level_ = Level::INFO;
    bool console_output_ = false;
    bool initialized_ = false;
    size_t max_file_size_bytes_ = 5 * 1024 * 1024;
    size_t current_file_size_ = 0;

    // Callers hold mutex_
    void writeLocked(Level level, const std::string& message,
                     const char* file, int line, const char* function);
    std::string formatMessage(Level level, const std::string& message,
                              const char* file, int line, const char* function) const;
    void rotateLogFileIfNeeded();

    static std::string getCurrentTimestamp();
    static std::string extractFileName(const char* file_path);
};

} // namespace bags

#define LOG_TRACE(msg) bags::Logger::getInstance().trace(msg, __FILE__, __LINE__, __FUNCTION__)
#define LOG_DEBUG(msg) bags::Logger::getInstance().debug(msg, __FILE__, __LINE__, __FUNCTION__)
#define LOG_INFO(msg) bags::Logger::getInstance().info(msg, __FILE__, __LINE__, __FUNCTION__)
#define LOG_WARN(msg) bags::Logger::getInstance().warn(msg, __FILE__, __LINE__, __FUNCTION__)
#define LOG_ERROR(msg) bags::Logger::getInstance().error(msg, __FILE__, __LINE__, __FUNCTION__)
#define LOG_FATAL(msg) bags::Logger::getInstance().fatal(msg, __FILE__, __LINE__, __FUNCTION__)

#define LOG_EXCEPTION(e, context) bags::Logger::getInstance().logException(e, context, __FILE__, __LINE__, __FUNCTION__)

#define BAGS_CONCAT_INNER(a, b) a##b
#define BAGS_CONCAT(a, b) BAGS_CONCAT_INNER(a, b)
#define PERF_TIMER(name) auto BAGS_CONCAT(perf_timer_, __LINE__) = bags::Logger::getInstance().createTimer(name)
