// =================================================================
// include/Rethink/Logger.hpp
// =================================================================
// Header for thread-safe logging with console and rotating file sinks.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Rethink {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Logging system shared by every component of the refinement core
 *
 * Provides structured logging with a console sink and a rotating file sink.
 * All public methods may be called concurrently from worker threads.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".rethink/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable the file sink
     * @param enabled True to write log files
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a circuit breaker state transition
     * @param breaker_id Endpoint key of the breaker
     * @param from Previous state name
     * @param to New state name
     * @param consecutive_failures Failure counter at the time of transition
     */
    void logBreakerTransition(const std::string& breaker_id, const std::string& from,
                              const std::string& to, size_t consecutive_failures);

    /**
     * @brief Log the outcome of one thinking round
     * @param round_index Index of the round
     * @param succeeded Number of successful candidates
     * @param attempted Number of candidates issued
     * @param selected_score Score of the selected candidate
     * @param duration_ms Wall time of the round in milliseconds
     */
    void logRoundSummary(size_t round_index, size_t succeeded, size_t attempted,
                         double selected_score, long duration_ms);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param user_prompt User prompt/request
     */
    void logSessionStart(const std::string& command, const std::string& user_prompt);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 0;
    size_t m_max_log_files = 0;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::recursive_mutex m_mutex;

    void initializeLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files);
    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if the current file exceeds the size limit
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define RETHINK_LOG_DEBUG(component, message) \
    Rethink::Logger::getInstance().debug(component, message)

#define RETHINK_LOG_INFO(component, message) \
    Rethink::Logger::getInstance().info(component, message)

#define RETHINK_LOG_WARNING(component, message) \
    Rethink::Logger::getInstance().warning(component, message)

#define RETHINK_LOG_ERROR(component, message) \
    Rethink::Logger::getInstance().error(component, message)

#define RETHINK_LOG_CRITICAL(component, message) \
    Rethink::Logger::getInstance().critical(component, message)

} // namespace Rethink
