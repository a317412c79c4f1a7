#include "audit_log.hpp"
#include <algorithm>
#include <stdexcept>

namespace losscalc {

bool AuditEntry::operator==(const AuditEntry& other) const {
    return stage == other.stage &&
           description == other.description &&
           value == other.value &&
           source_label == other.source_label &&
           source_locator == other.source_locator;
}

AuditLog::AuditLog() : frozen_(false) {}

void AuditLog::record(Stage stage, const std::string& description, double value,
                      const std::string& source_label, const std::string& source_locator) {
    if (frozen_) {
        throw std::logic_error("Audit log is frozen; cannot record '" + description + "'");
    }
    entries_.push_back(AuditEntry{stage, description, value, source_label, source_locator});
}

void AuditLog::record(Stage stage, const std::string& description, double value,
                      const Citation& citation) {
    record(stage, description, value, citation.source_label, citation.locator);
}

size_t AuditLog::count(Stage stage) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [stage](const AuditEntry& e) { return e.stage == stage; }));
}

std::vector<AuditEntry> AuditLog::freeze() {
    if (frozen_) {
        throw std::logic_error("Audit log already frozen");
    }
    frozen_ = true;
    std::vector<AuditEntry> frozen_entries;
    frozen_entries.swap(entries_);
    return frozen_entries;
}

} // namespace losscalc
