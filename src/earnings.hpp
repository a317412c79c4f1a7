#ifndef LOSSCALC_EARNINGS_HPP
#define LOSSCALC_EARNINGS_HPP

#include "audit_log.hpp"
#include "case_config.hpp"
#include "wage_growth.hpp"
#include <vector>

namespace losscalc {

// Remainders at or below this are treated as whole years
constexpr double PRORATION_EPSILON = 1e-6;

struct EarningsEntry {
    unsigned year_index;
    int calendar_year;
    double year_fraction;           // 1.0, or the remainder for the final year
    double full_year_earnings;      // Salary level for the whole year
    double nominal_earnings;        // full_year_earnings * year_fraction
};

struct EarningsSchedule {
    std::vector<EarningsEntry> entries;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    double total_nominal() const;

    // Sum of year fractions; equals the work-life years it was built from
    double total_years() const;
};

/**
 * Project nominal earnings over the remaining work-life.
 *
 * Year i earns base_salary * prod_{k<i} (1 + g_k). Whole years get a
 * year fraction of 1; a remainder above PRORATION_EPSILON adds one more
 * prorated year. Values are kept at full precision.
 *
 * @param base_salary Annual salary at the evaluation date
 * @param growth Growth schedule covering at least the projected years
 * @param worklife_years Remaining work-life, already clamped
 * @param evaluation_date Start of the projection
 * @param audit Receives one citation for the base salary
 * @throws std::invalid_argument if the growth schedule is too short
 */
EarningsSchedule project_earnings(
    double base_salary,
    const GrowthSchedule& growth,
    double worklife_years,
    const Date& evaluation_date,
    AuditLog& audit
);

} // namespace losscalc

#endif // LOSSCALC_EARNINGS_HPP
