#ifndef LOSSCALC_WAGE_GROWTH_HPP
#define LOSSCALC_WAGE_GROWTH_HPP

#include "audit_log.hpp"
#include "case_config.hpp"
#include "reference_tables.hpp"
#include <optional>
#include <vector>

namespace losscalc {

struct GrowthEntry {
    unsigned year_index;            // 0 = evaluation year
    int calendar_year;
    double rate;
    bool carried_forward;           // Rate reused from the last table year

    bool operator==(const GrowthEntry& other) const;
};

struct GrowthSchedule {
    std::vector<GrowthEntry> entries;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    // Arithmetic mean of the rates, empty when the schedule is empty
    std::optional<double> average_rate() const;
};

// One year of the historical wage series; year_index 0 is the oldest year
struct WageHistoryEntry {
    unsigned year_index;
    int calendar_year;
    double mean_wage;
    std::optional<double> yoy_growth;   // Empty for the oldest year
};

struct WageHistory {
    std::vector<WageHistoryEntry> entries;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    // Mean of the year-over-year rates, empty when there are none
    std::optional<double> average_growth() const;
};

// Years in the historical series, evaluation year included
constexpr unsigned WAGE_HISTORY_YEARS = 7;

// Number of projection years covering a fractional work-life: ceil(years)
size_t horizon_years(double worklife_years);

// Build the year-by-year growth rates for the projection horizon.
//
// A zero horizon returns an empty schedule without consulting any source.
// An override produces a constant schedule cited once. Table rates are
// looked up per calendar year for the category; years past the table's
// last year reuse its rate and are cited as carried forward. Each distinct
// table row is cited once, in order of first use.
//
// Throws TableLookupError for an unknown category or years before coverage.
GrowthSchedule project_wage_growth(
    int base_year,
    size_t horizon,
    const RateSource& source,
    const WageGrowthTable& table,
    AuditLog& audit
);

// Reconstruct the mean wage for the years up to the evaluation year.
//
// The evaluation year earns base_salary; each earlier year is the next
// year's wage divided by (1 + growth of that next year). Growth comes from
// the override (cited once) or the table rate for each calendar year
// (each distinct row cited once). The series stops early when it reaches
// the first year the table covers for the category.
//
// Throws TableLookupError for an unknown category or a gap in coverage,
// InvalidConfigError for an override at or below -100%.
WageHistory build_wage_history(
    double base_salary,
    int base_year,
    const RateSource& source,
    const WageGrowthTable& table,
    AuditLog& audit,
    unsigned years = WAGE_HISTORY_YEARS
);

} // namespace losscalc

#endif // LOSSCALC_WAGE_GROWTH_HPP
