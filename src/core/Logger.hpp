/**
 * @file Logger.hpp
 * @brief Facility-based logging with a single output point
 *
 * Every component owns a Logger named after itself. Verbosity is
 * resolved per facility first, then against the process default, and
 * all output funnels through one method that writes to stderr so that
 * data written to stdout stays clean.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pgexport {

/**
 * @brief Log levels
 *
 * Level 1: Errors (abort the export)
 * Level 2: Warnings (degraded behaviour, export continues)
 * Level 3: Information (one line per export)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Debugging (progress, timings)
 * Level 6: Tracing (individual values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

const char* log_level_name(LogLevel level);

class Logger {
public:
    Logger();

    /**
     * @brief Constructor with facility name
     * @param component_name Facility used for per-component level lookup
     */
    explicit Logger(const std::string& component_name);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the facility's verbosity
     *
     * The only place that decides whether a message is printed. A message
     * identical to the previous one is counted instead of repeated.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

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
     * @brief Emit any pending repeat summary and flush stderr and the log file
     */
    void flush() const;

    /// Facility name this logger reports under
    const std::string& component() const { return component_name_; }

    /**
     * @brief Effective level for this logger
     *
     * Facility-specific level if one is registered, otherwise the
     * process-wide default.
     */
    LogLevel getEffectiveLevel() const;

    // ========================================================================
    // Process-wide configuration
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getDefaultLevel();
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a level configuration string
     *
     * Accepted forms:
     * - "5" sets the default level to DEBUG
     * - "CsvExporter=6,PgStore=4" sets facility levels
     * - "4,CsvExporter=6" mixes both; "default=3" is also accepted
     *
     * Levels are clamped to 1..6. Malformed entries are reported and skipped.
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Mirror all output to a file (append mode), or stop with nullopt
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& path);

private:
    std::string component_name_;

    mutable std::mutex output_mutex_;
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> file_stream_;

    void doOutput(LogLevel level, const std::string& message) const;
    void flushRepeats() const;
};

}  // namespace pgexport
