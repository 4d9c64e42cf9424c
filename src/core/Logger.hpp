/**
 * @file Logger.hpp
 * @brief Facility-aware logging with verbosity control
 *
 * Every component owns a Logger named after itself. The effective level
 * of a logger comes from its facility entry in the shared registry, then
 * its own level, then the global default.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>

namespace hexmosaic {

/**
 * @brief Log levels
 *
 * Level 1: Errors (the requested operation failed)
 * Level 2: Warnings (a feature or layer was skipped)
 * Level 3: Information (one line per user action)
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

/**
 * @brief Logger with a single output path for console and file
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with component name
     * @param component_name Facility name used for per-component levels
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with specified log level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Consecutive identical messages are counted and reported once as
     * "The previous message occurred N times."
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

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
     * @brief Set log level for a specific facility (component)
     *
     * @example
     * Logger::setFacilityLevel("HexGridTessellator", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    static void setDefaultLevel(LogLevel level);

    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * Supported formats:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "ElevationSampler=6,SegmentationEngine=3"
     * - Mixed: "4,ZonalStatistics=6"
     *
     * Level 0 silences everything except errors.
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Redirect every logger's file output to a shared log file
     * @param log_file Path to the log file, or nullopt to stop file logging
     */
    static void setGlobalLogFile(const std::optional<std::string>& log_file);

    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Static facility-based logging registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> global_file_stream_;
    static std::mutex registry_mutex_;

    void initializeFileStream();

    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace hexmosaic
