// =================================================================
// include/Relay/Logger.hpp
// =================================================================
// Header for component-tagged logging of routing and monitoring events.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>
#include <deque>

namespace Relay {

/**
 * @brief Log levels, lowest first
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * @brief One log line before formatting
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;   ///< Emitting component, e.g. "RoutingEngine"
    std::string message;
    std::string context;     ///< Optional detail shown in parentheses
};

/**
 * @brief Output targets and rotation limits
 */
struct LogSettings {
    std::string log_dir = ".relay/logs";       ///< Directory for relay_*.log files
    size_t max_file_bytes = 10 * 1024 * 1024;  ///< Rotate when a file grows past this
    size_t max_files = 5;                      ///< Older files are deleted on rotation
    size_t max_pending_lines = 10000;          ///< Oldest buffered lines are dropped past this
    LogLevel console_level = LogLevel::INFO;
    LogLevel file_level = LogLevel::INFO;
    bool console_enabled = true;
};

/**
 * @brief Process-wide logger for the routing core
 *
 * Writes colored, levelled lines to the console. Lines for the size-rotated
 * log file are buffered in memory and only written by flush(), which the
 * monitor runs from its scheduler, so logging never touches the disk on the
 * caller's thread. All methods are safe to call from the request path and
 * from scheduler threads.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Replace the settings; the next flush() opens a new file
     * @param settings New output settings
     */
    void configure(const LogSettings& settings);

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console output (tests turn it off)
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Record one entry at the given level
     */
    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& context = "");

    void debug(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::DEBUG, component, message, context);
    }
    void info(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::INFO, component, message, context);
    }
    void warning(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::WARNING, component, message, context);
    }
    void error(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::ERROR, component, message, context);
    }
    void critical(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::CRITICAL, component, message, context);
    }

    /**
     * @brief Log a routing decision
     * @param request_id Request being routed
     * @param provider Selected provider
     * @param algorithm Balancing algorithm name
     * @param score Composite score of the selected provider
     * @param fallback_used Whether requirements could not be met
     */
    void logRoutingDecision(const std::string& request_id, const std::string& provider,
                            const std::string& algorithm, double score, bool fallback_used);

    /**
     * @brief Log the outcome of a tracked request (failures at WARNING)
     */
    void logRequestOutcome(const std::string& request_id, const std::string& provider,
                           double duration_ms, bool success);

    /**
     * @brief Log a raised alert at a level matching its severity
     * @param severity Severity name (LOW, MEDIUM, HIGH, CRITICAL)
     * @param subject Provider or service the alert concerns
     * @param message Alert message
     */
    void logAlert(const std::string& severity, const std::string& subject, const std::string& message);

    /**
     * @brief Write buffered lines to the log file, opening or rotating it as needed
     */
    void flush();

    /**
     * @brief Lines waiting for the next flush()
     */
    size_t pendingLines() const;

    /**
     * @brief Path of the file currently written, empty before the first flush
     */
    std::string currentLogFile() const;

    static std::string levelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogSettings m_settings;
    std::unique_ptr<std::ofstream> m_file;
    std::string m_file_path;
    size_t m_file_bytes = 0;
    size_t m_file_sequence = 0;
    bool m_file_failed = false;
    std::deque<std::string> m_pending;
    size_t m_dropped = 0;

    mutable std::mutex m_mutex;

    void emitConsole(const LogEntry& entry) const;
    void writeLine(const std::string& line);

    /**
     * @brief Render an entry as one line
     * @param entry Entry to render
     * @param colored Wrap the level tag in ANSI color codes
     */
    static std::string render(const LogEntry& entry, bool colored);

    void openFile();
    void pruneOldFiles();
    std::string nextFilePath();
};

// Convenience macros for logging
#define LOG_DEBUG(component, ...) \
    Relay::Logger::getInstance().debug(component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    Relay::Logger::getInstance().info(component, __VA_ARGS__)

#define LOG_WARNING(component, ...) \
    Relay::Logger::getInstance().warning(component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    Relay::Logger::getInstance().error(component, __VA_ARGS__)

#define LOG_CRITICAL(component, ...) \
    Relay::Logger::getInstance().critical(component, __VA_ARGS__)

} // namespace Relay
