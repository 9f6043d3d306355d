/**
 * @file Logger.hpp
 * @brief Centralized logging system with verbosity control
 *
 * Every component owns a Logger named after itself. Output goes through a
 * single outputMessage() call with one verbosity check, so levels can be
 * tuned globally or per facility from the command line.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace debris {

/**
 * @brief Log levels
 *
 * Level 0: Silent
 * Level 1: Errors (generation or export failed)
 * Level 2: Warnings (retrying, degraded output)
 * Level 3: Information (high-level progress, default)
 * Level 4: Detailed information (stage execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (coordinates, variable values)
 */
enum class LogLevel {
    SILENT = 0,
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Centralized logger with single point of output control
 */
class Logger {
public:
    /**
     * @brief Constructor with component name
     *
     * The component name doubles as the facility used for per-facility
     * level overrides (see parseLogConfig()).
     *
     * @param component_name Name of the component for logging identification
     */
    explicit Logger(const std::string& component_name = "");

    /**
     * @brief Destructor - reports pending repeats and flushes
     */
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Consecutive identical messages are folded into a single
     * "occurred N times" line.
     *
     * @param level Level of this message
     * @param message Message to output
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    /**
     * @brief Override the level for this instance only
     */
    void setLogLevel(LogLevel level) { instance_level_ = level; }

    /**
     * @brief Check if a message level would be output
     */
    bool shouldOutput(LogLevel level) const {
        return level != LogLevel::SILENT &&
               static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    /**
     * @brief Trace messages (Level 6) are flushed immediately
     */
    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending repeat summaries and output buffers
     */
    void flush() const;

    /**
     * @brief Resolve the level for this instance
     *
     * Facility override first, then instance override, then global default.
     */
    LogLevel getEffectiveLevel() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getDefaultLevel();
    static LogLevel getFacilityLevel(const std::string& facility);
    static void clearFacilityLevels();

    /**
     * @brief Parse and apply log configuration from string
     *
     * Formats:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "ConvexHullBuilder=6,STLExporter=4"
     * - Mixed: "2,ScaleNormalizer=6" (default WARNING, ScaleNormalizer TRACE)
     * - "default=N" is the same as a bare "N"
     *
     * Unparseable tokens are reported on stderr. The configuration is applied
     * only if every token parses.
     *
     * @return false if any token was rejected; the registry is then unchanged
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Mirror all logger output to a file (append mode)
     * @param log_file Path to log file, or nullopt to stop file logging
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& log_file);

private:
    std::string component_name_;
    std::optional<LogLevel> instance_level_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_ = LogLevel::INFO;
    mutable int repeat_count_ = 0;
    mutable bool has_last_message_ = false;

    // Static facility registry and shared file sink
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;
    static std::shared_ptr<std::ofstream> file_stream_;

    void flushRepeatsLocked() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace debris
