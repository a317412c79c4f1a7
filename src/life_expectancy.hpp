#ifndef LOSSCALC_LIFE_EXPECTANCY_HPP
#define LOSSCALC_LIFE_EXPECTANCY_HPP

#include "audit_log.hpp"
#include "case_config.hpp"
#include "reference_tables.hpp"
#include <vector>

namespace losscalc {

// A life table row that contributed to an interpolated value
struct LifeTableRowUse {
    unsigned age;
    double ex;
    double weight;                  // Interpolation weight, rows sum to 1.0
    Citation citation;
};

struct LifeExpectancyResult {
    double age;                     // Fractional age at evaluation date
    double remaining_years;         // Resolved e(x), >= 0
    bool from_override;
    std::vector<LifeTableRowUse> rows;  // Empty when from_override
    std::vector<double> timeline;       // Fraction of each remaining year lived

    LifeExpectancyResult();
};

// Remainders at or below this are dropped from a year timeline
constexpr double TIMELINE_EPSILON = 1e-6;

// 1.0 for each whole year of `years`, then the fractional remainder if it
// exceeds TIMELINE_EPSILON. Empty for years <= 0.
std::vector<double> year_fraction_timeline(double years);

// Resolve remaining life expectancy at a fractional age.
//
// Override: the value is returned verbatim and cited as a user override.
// Table: e(x) is interpolated linearly between rows floor(age) and
// floor(age)+1; each row used is cited. Integral ages (and the table's
// maximum age) use a single row.
//
// Throws InvalidAgeError if age < 0 or age > table.max_age() on the
// table path, InvalidConfigError for a negative override.
LifeExpectancyResult resolve_life_expectancy(
    double age,
    Sex sex,
    const LifeExpectancySource& source,
    const LifeTable& table,
    AuditLog& audit
);

} // namespace losscalc

#endif // LOSSCALC_LIFE_EXPECTANCY_HPP
