// =================================================================
// include/ContextStudio/Logger.hpp
// =================================================================
// Header for the logging collaborator shared by all components.

#pragma once

#include <string>
#include <vector>
#include <deque>
#include <fstream>
#include <chrono>
#include <memory>

namespace ContextStudio {

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
 * @brief Logging system for diagnostics
 *
 * One instance is initialized at process start and flushed at shutdown.
 * Components take a Logger& at construction and default to getInstance().
 * Console output goes to stderr; stdout is reserved for the assembled
 * document.
 */
class Logger {
public:
    /**
     * @brief Get the process-wide logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".context_studio/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable the rotating log file
     *
     * Must be called before initialize() to avoid creating the log directory.
     * @param enabled True to enable file output
     */
    void setFileLogging(bool enabled);

    /**
     * @brief Directory receiving log files, valid after initialize()
     */
    const std::string& logDirectory() const { return m_log_dir; }

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a directory scan
     * @param root_path Scanned root
     * @param directories Directory nodes produced
     * @param files File nodes produced
     * @param skipped Entries skipped (excluded, unreadable, special files)
     * @param cycles Directories cut short by the cycle guard
     */
    void logScanSummary(const std::string& root_path, size_t directories, size_t files,
                        size_t skipped, size_t cycles);

    /**
     * @brief Log context building statistics
     * @param total_files Selected files handed to the builder
     * @param included_files Files emitted as code blocks
     * @param empty_files Zero-byte files left out
     * @param failed_files Files emitted as error placeholders
     * @param tokens_used Estimated tokens of the document
     */
    void logContextBuilding(size_t total_files, size_t included_files, size_t empty_files,
                            size_t failed_files, size_t tokens_used);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param root_path Project root being loaded
     */
    void logSessionStart(const std::string& command, const std::string& root_path);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Recent entries kept in memory, oldest first
     */
    std::vector<LogEntry> recentEntries() const;

    /**
     * @brief Drop the in-memory history
     */
    void clearHistory();

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     */
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name (debug, info, warning, error, critical)
     * @throws std::invalid_argument for unknown names
     */
    static LogLevel parseLevel(const std::string& name);

private:
    static constexpr size_t kMaxHistory = 256;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::deque<LogEntry> m_history;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging through the process-wide instance
#define CS_LOG_DEBUG(component, message) \
    ContextStudio::Logger::getInstance().debug(component, message)

#define CS_LOG_INFO(component, message) \
    ContextStudio::Logger::getInstance().info(component, message)

#define CS_LOG_WARNING(component, message) \
    ContextStudio::Logger::getInstance().warning(component, message)

#define CS_LOG_ERROR(component, message) \
    ContextStudio::Logger::getInstance().error(component, message)

#define CS_LOG_CRITICAL(component, message) \
    ContextStudio::Logger::getInstance().critical(component, message)

} // namespace ContextStudio
