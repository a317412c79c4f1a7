#include "logger.hpp"
#include "io/json_writer.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace losscalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_tables_loaded(
    const std::string& sources_key,
    size_t worklife_tables,
    size_t discount_series,
    bool cache_hit
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "tables_loaded";
    fields["sources"] = sources_key;
    fields["worklife_tables"] = std::to_string(worklife_tables);
    fields["discount_series"] = std::to_string(discount_series);
    fields["cache_hit"] = cache_hit ? "true" : "false";

    log(LogLevel::DEBUG, "Reference tables ready", fields);
}

void Logger::log_case_start(const CaseContext& ctx, double age_years) {
    std::map<std::string, std::string> fields;
    fields["event"] = "case_start";
    fields["case_id"] = ctx.case_id;
    fields["batch_index"] = std::to_string(ctx.batch_index);
    fields["age_years"] = format_number(age_years);

    log(LogLevel::INFO, "Starting case", fields);
}

void Logger::log_stage_complete(
    const CaseContext& ctx,
    Stage stage,
    size_t citations,
    double value
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "stage_complete";
    fields["case_id"] = ctx.case_id;
    fields["stage"] = to_string(stage);
    fields["citations"] = std::to_string(citations);
    fields["value"] = format_number(value);

    log(LogLevel::DEBUG, "Stage completed", fields);
}

void Logger::log_case_complete(
    const CaseContext& ctx,
    double total_loss,
    size_t audit_entries,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "case_complete";
    fields["case_id"] = ctx.case_id;
    fields["batch_index"] = std::to_string(ctx.batch_index);
    fields["total_loss_usd"] = format_number(total_loss);
    fields["audit_entries"] = std::to_string(audit_entries);
    fields["execution_time_ms"] = format_number(elapsed_ms);

    log(LogLevel::INFO, "Case completed", fields);
}

void Logger::log_batch_complete(size_t cases, size_t failures, double elapsed_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "batch_complete";
    fields["cases"] = std::to_string(cases);
    fields["failures"] = std::to_string(failures);
    fields["execution_time_ms"] = format_number(elapsed_ms);

    log(failures == 0 ? LogLevel::INFO : LogLevel::WARN, "Batch completed", fields);
}

void Logger::log_error(const CaseContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["case_id"] = ctx.case_id;
    fields["batch_index"] = std::to_string(ctx.batch_index);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Case failed", fields);
}

void Logger::log_warning(const CaseContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["case_id"] = ctx.case_id;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }
    write_output(format_line(level, message, fields));
}

std::string Logger::format_line(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) const {
    std::ostringstream oss;

    if (config_.enable_json) {
        // Envelope keys first, then event fields in key order
        oss << "{\"timestamp\":\"" << get_timestamp() << "\""
            << ",\"level\":\"" << level_to_string(level) << "\""
            << ",\"message\":\"" << io::escape_json(message) << "\"";
        for (const auto& [key, value] : fields) {
            oss << ",\"" << io::escape_json(key) << "\":\"" << io::escape_json(value) << "\"";
        }
        oss << "}";
        return oss.str();
    }

    oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;
    if (!fields.empty()) {
        const char* separator = " {";
        for (const auto& [key, value] : fields) {
            oss << separator << key << "=" << value;
            separator = ", ";
        }
        oss << "}";
    }
    return oss.str();
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_number(double value) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace losscalc
