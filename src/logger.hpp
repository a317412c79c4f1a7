/**
 * @file logger.hpp
 * @brief Diagnostic log of table loading, case runs and batches
 *
 * Each event is one line on stderr and/or in a log file, either as
 * "timestamp [LEVEL] message {key=value, ...}" or as a flat JSON object.
 * Lines are written under a mutex; batch cases log from OpenMP threads.
 */

#ifndef LOSSCALC_LOGGER_HPP
#define LOSSCALC_LOGGER_HPP

#include "stage.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace losscalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-stage detail and table loading
    INFO,    ///< Case start/completion
    WARN,    ///< Non-fatal issues (clamped work-life, carried-forward rates)
    ERROR    ///< Failed cases
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Case context attached to every case event
 */
struct CaseContext {
    std::string case_id;
    size_t batch_index;              ///< Position within a batch (0 for single runs)

    CaseContext() : batch_index(0) {}
    explicit CaseContext(const std::string& id, size_t index = 0)
        : case_id(id), batch_index(index) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("losscalc.log"),
          enable_json(false) {}
};

/**
 * @brief Structured logger for table loading and case runs
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "losscalc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   CaseContext ctx("case-001");
 *   logger.log_case_start(ctx, 45.2);
 *   logger.log_case_complete(ctx, 1234567.89, 12, 3.4);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Opens (appending) or closes the log file as requested.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a reference table bundle becoming available
     *
     * @param sources_key Identity of the loaded sources
     * @param worklife_tables Number of work-life tables
     * @param discount_series Number of discount series
     * @param cache_hit True if the bundle came from the cache
     */
    void log_tables_loaded(
        const std::string& sources_key,
        size_t worklife_tables,
        size_t discount_series,
        bool cache_hit
    );

    /**
     * @brief Log the start of a case run
     */
    void log_case_start(const CaseContext& ctx, double age_years);

    /**
     * @brief Log completion of one pipeline stage
     *
     * @param ctx Case context
     * @param stage Completed stage
     * @param citations Audit entries the stage recorded
     * @param value Headline value of the stage (years, entries or total)
     */
    void log_stage_complete(
        const CaseContext& ctx,
        Stage stage,
        size_t citations,
        double value
    );

    /**
     * @brief Log successful completion of a case run
     */
    void log_case_complete(
        const CaseContext& ctx,
        double total_loss,
        size_t audit_entries,
        double elapsed_ms
    );

    /**
     * @brief Log completion of a batch
     */
    void log_batch_complete(size_t cases, size_t failures, double elapsed_ms);

    /**
     * @brief Log a failed case
     */
    void log_error(const CaseContext& ctx, const std::string& error_message);

    /**
     * @brief Log a warning for a case
     */
    void log_warning(const CaseContext& ctx, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_line(LogLevel level, const std::string& message,
                            const std::map<std::string, std::string>& fields) const;
    std::string format_number(double value) const;
    void write_output(const std::string& output);
};

} // namespace losscalc

#endif // LOSSCALC_LOGGER_HPP
