// =================================================================
// include/Loom/Logger.hpp
// =================================================================
// Header for structured logging to console and rotating log files.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace Loom {

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
 * @brief Process-wide logger with separate console and file thresholds
 *
 * Console output goes to stderr so it never mixes with command output.
 * File output is written under the log directory and rotated by size.
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
    void initialize(const std::string& log_dir = ".loom/logs",
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
     * @brief Enable or disable log files
     *
     * Must be called before the first entry is logged to avoid creating
     * the log directory at all.
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a grouping run
     * @param file_count Number of files grouped
     * @param group_count Number of groups produced
     * @param relationship_count Number of pairwise relationships found
     */
    void logGrouping(size_t file_count, size_t group_count, size_t relationship_count);

    /**
     * @brief Log commit message generation metadata
     * @param prompt_tokens Tokens billed for the prompt
     * @param completion_tokens Tokens billed for the completion
     * @param cost_eur Total cost of the request
     * @param duration_ms Request duration in milliseconds
     * @param success Whether request succeeded
     */
    void logAiRequest(int prompt_tokens, int completion_tokens, double cost_eur,
                      long duration_ms, bool success);

    /**
     * @brief Log a git invocation and its exit code
     */
    void logGitCommand(const std::string& command, int exit_code);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param details Option summary for the session
     */
    void logSessionStart(const std::string& command, const std::string& details);

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

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name such as "debug" or "WARN"
     * @return The level, or INFO for unknown names
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

    /**
     * @brief Ensure log directory exists
     * @return False when the directory cannot be created
     */
    bool ensureLogDirectory();

    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOOM_LOG_DEBUG(...) \
    Loom::Logger::getInstance().debug(__VA_ARGS__)

#define LOOM_LOG_INFO(...) \
    Loom::Logger::getInstance().info(__VA_ARGS__)

#define LOOM_LOG_WARNING(...) \
    Loom::Logger::getInstance().warning(__VA_ARGS__)

#define LOOM_LOG_ERROR(...) \
    Loom::Logger::getInstance().error(__VA_ARGS__)

#define LOOM_LOG_CRITICAL(...) \
    Loom::Logger::getInstance().critical(__VA_ARGS__)

} // namespace Loom
