#include "earnings.hpp"
#include <cmath>
#include <stdexcept>

namespace losscalc {

double EarningsSchedule::total_nominal() const {
    double total = 0.0;
    for (const auto& entry : entries) {
        total += entry.nominal_earnings;
    }
    return total;
}

double EarningsSchedule::total_years() const {
    double total = 0.0;
    for (const auto& entry : entries) {
        total += entry.year_fraction;
    }
    return total;
}

EarningsSchedule project_earnings(
    double base_salary,
    const GrowthSchedule& growth,
    double worklife_years,
    const Date& evaluation_date,
    AuditLog& audit)
{
    EarningsSchedule schedule;
    if (!(worklife_years > 0.0)) {
        return schedule;
    }

    const double whole = std::floor(worklife_years);
    const double remainder = worklife_years - whole;
    const size_t full_years = static_cast<size_t>(whole);
    const bool prorate = remainder > PRORATION_EPSILON;
    const size_t count = full_years + (prorate ? 1 : 0);

    if (growth.size() < count) {
        throw std::invalid_argument(
            "Growth schedule has " + std::to_string(growth.size()) +
            " years, earnings projection needs " + std::to_string(count));
    }

    schedule.entries.reserve(count);
    double level = base_salary;

    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            level *= 1.0 + growth.entries[i - 1].rate;
        }
        const double fraction = (i < full_years) ? 1.0 : remainder;
        schedule.entries.push_back(EarningsEntry{
            static_cast<unsigned>(i),
            evaluation_date.year + static_cast<int>(i),
            fraction,
            level,
            level * fraction
        });
    }

    if (!schedule.entries.empty()) {
        audit.record(Stage::Earnings, "Base annual salary", base_salary,
                     CASE_CONFIG_LABEL, "occupation.base_salary_usd");
    }

    return schedule;
}

} // namespace losscalc
