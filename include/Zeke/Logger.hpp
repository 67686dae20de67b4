// =================================================================
// include/Zeke/Logger.hpp
// =================================================================
// Header for structured, thread-safe logging of orchestrator activity.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Zeke {

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
 * @brief Logging system shared by the orchestrator, its workers and the cache
 *
 * Writes leveled entries to the console and to size-rotated log files.
 * Every public method may be called from any worker thread.
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
    void initialize(const std::string& log_dir = ".zeke/logs",
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

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a single provider call
     * @param provider Provider name
     * @param operation Operation name (chat_completion, code_analysis, ...)
     * @param duration_ms Call duration in milliseconds
     * @param success Whether the call succeeded
     */
    void logProviderCall(const std::string& provider, const std::string& operation,
                         long duration_ms, bool success);

    /**
     * @brief Log a task state transition
     * @param task_id Task identifier
     * @param from Previous status name
     * @param to New status name
     */
    void logTaskTransition(unsigned long long task_id, const std::string& from, const std::string& to);

    /**
     * @brief Log response cache counters
     */
    void logCacheStatistics(size_t entries, size_t max_entries, size_t hits, size_t misses);

    /**
     * @brief Log the result of a batch submission
     */
    void logBatchSummary(size_t submitted, size_t completed, size_t failed, size_t cancelled);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Parse a level name (debug, info, warning, error, critical)
     * @throws std::invalid_argument on unknown names
     */
    static LogLevel parseLevel(const std::string& name);

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    mutable std::recursive_mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files once the current one exceeds the size limit
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

#define ZEKE_LOG_DEBUG(component, message) \
    Zeke::Logger::getInstance().debug(component, message)

#define ZEKE_LOG_INFO(component, message) \
    Zeke::Logger::getInstance().info(component, message)

#define ZEKE_LOG_WARNING(component, message) \
    Zeke::Logger::getInstance().warning(component, message)

#define ZEKE_LOG_ERROR(component, message) \
    Zeke::Logger::getInstance().error(component, message)

#define ZEKE_LOG_CRITICAL(component, message) \
    Zeke::Logger::getInstance().critical(component, message)

} // namespace Zeke
