/**
 * @file Logger.hpp
 * @brief Centralized logging with per-facility verbosity control
 *
 * Every component owns a Logger named after itself. All output funnels
 * through outputMessage(), which holds the single verbosity check.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rfprof {

/**
 * @brief Log levels
 *
 * Level 1: Errors (run aborts)
 * Level 2: Warnings (fallback used, feature disabled)
 * Level 3: Information (phase progress)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

std::string log_level_label(LogLevel level);

/**
 * @brief Component logger with a single point of output control
 *
 * Consecutive identical messages are folded into one line plus a
 * repeat count, which keeps per-point warnings from flooding the log.
 */
class Logger {
public:
    Logger();

    /**
     * @brief Logger for a named facility
     * @param component_name Facility name, matched against "Name=level" settings
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Logger with a fixed level and an optional private log file
     * @param level Threshold for this instance
     * @param log_file Path to append to
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it passes the effective verbosity level
     *
     * The only verbosity check in the code base.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or clear this instance's private log file
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void warn(const std::string& message) const { warning(message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush console and file output, emitting any pending repeat count
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for one facility
     *
     * @example
     * Logger::setFacilityLevel("ZoneResolver", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Fallback level for facilities without a specific setting
     */
    static void setDefaultLevel(LogLevel level);

    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * Formats:
     * - "5"                          default level DEBUG
     * - "Extractor=6,default=3"      Extractor at TRACE, others INFO
     * - "4,PipelineCache=6"          default DETAILED, PipelineCache TRACE
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Log file shared by every Logger without a private file
     *
     * Opened in append mode. Pass nullopt to stop file logging.
     */
    static void setDefaultLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Effective level: facility setting, then instance level, then global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Repeated message folding
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> default_file_stream_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> openAppendStream(const std::string& path);

    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace rfprof
