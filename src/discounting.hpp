#ifndef LOSSCALC_DISCOUNTING_HPP
#define LOSSCALC_DISCOUNTING_HPP

#include "audit_log.hpp"
#include "case_config.hpp"
#include "earnings.hpp"
#include "reference_tables.hpp"
#include <optional>
#include <vector>

namespace losscalc {

struct DiscountFactorEntry {
    unsigned year_index;
    int calendar_year;
    double rate;                    // Rate in effect for this year
    double discount_factor;         // prod_{k<i} 1/(1+r_k); 1.0 at index 0
};

struct DiscountFactorSchedule {
    std::vector<DiscountFactorEntry> entries;

    // Rate applied in the first projection year, empty for an empty schedule
    std::optional<double> nominal_rate;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
};

struct PresentValueEntry {
    unsigned year_index;
    int calendar_year;
    double year_fraction;
    double nominal_earnings;
    double discount_factor;
    double present_value;
    double cumulative_present_value;
};

struct PresentValueResult {
    std::vector<PresentValueEntry> entries;
    double total;                   // Total economic loss

    PresentValueResult() : total(0.0) {}
};

// Discount factors for every earnings year, with start-of-year timing.
// Table rates follow the same carry-forward rule as wage growth. Each
// distinct rate used is cited once; an empty earnings schedule consults
// no source and records nothing.
//
// Throws InvalidConfigError for rates <= -1 and TableLookupError for an
// unknown series or uncovered years.
DiscountFactorSchedule compute_discount_factors(
    const EarningsSchedule& earnings,
    int base_year,
    const RateSource& source,
    const ReferenceTables& tables,
    AuditLog& audit
);

// PV_i = nominal_i * factor_i, with running and grand totals.
// Throws std::invalid_argument if the schedules do not line up.
PresentValueResult compute_present_values(
    const EarningsSchedule& earnings,
    const DiscountFactorSchedule& factors
);

} // namespace losscalc

#endif // LOSSCALC_DISCOUNTING_HPP
