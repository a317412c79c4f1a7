#ifndef LOSSCALC_AUDIT_LOG_HPP
#define LOSSCALC_AUDIT_LOG_HPP

#include "reference_tables.hpp"
#include "stage.hpp"
#include <string>
#include <vector>

namespace losscalc {

// One cited assumption or table value consumed by a stage
struct AuditEntry {
    Stage stage;
    std::string description;
    double value;
    std::string source_label;
    std::string source_locator;

    bool operator==(const AuditEntry& other) const;
};

/**
 * AuditLog accumulates citations for a single case run.
 *
 * Append-only: entries keep the order in which stages recorded them and
 * are never edited or removed. One log exists per run and is handed to
 * each stage by reference; freeze() moves the entries out when the
 * pipeline completes, after which record() throws std::logic_error.
 */
class AuditLog {
public:
    AuditLog();

    void record(Stage stage, const std::string& description, double value,
                const std::string& source_label, const std::string& source_locator);

    void record(Stage stage, const std::string& description, double value,
                const Citation& citation);

    const std::vector<AuditEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    bool frozen() const { return frozen_; }

    // Number of entries recorded by one stage
    size_t count(Stage stage) const;

    std::vector<AuditEntry> freeze();

private:
    std::vector<AuditEntry> entries_;
    bool frozen_;
};

// Label used for values supplied directly by the case configuration
constexpr const char* USER_OVERRIDE_LABEL = "user override";
constexpr const char* CASE_CONFIG_LABEL = "case configuration";

} // namespace losscalc

#endif // LOSSCALC_AUDIT_LOG_HPP
