#include "wage_growth.hpp"
#include "errors.hpp"
#include <cmath>
#include <numeric>
#include <set>

namespace losscalc {

bool GrowthEntry::operator==(const GrowthEntry& other) const {
    return year_index == other.year_index &&
           calendar_year == other.calendar_year &&
           rate == other.rate &&
           carried_forward == other.carried_forward;
}

std::optional<double> GrowthSchedule::average_rate() const {
    if (entries.empty()) {
        return std::nullopt;
    }
    double sum = std::accumulate(entries.begin(), entries.end(), 0.0,
        [](double acc, const GrowthEntry& e) { return acc + e.rate; });
    return sum / static_cast<double>(entries.size());
}

std::optional<double> WageHistory::average_growth() const {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& entry : entries) {
        if (entry.yoy_growth) {
            sum += *entry.yoy_growth;
            ++count;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(count);
}

size_t horizon_years(double worklife_years) {
    if (!(worklife_years > 0.0)) {
        return 0;
    }
    return static_cast<size_t>(std::ceil(worklife_years));
}

GrowthSchedule project_wage_growth(
    int base_year,
    size_t horizon,
    const RateSource& source,
    const WageGrowthTable& table,
    AuditLog& audit)
{
    GrowthSchedule schedule;
    if (horizon == 0) {
        return schedule;
    }
    schedule.entries.reserve(horizon);

    if (const auto* override_value = std::get_if<UserOverride>(&source)) {
        if (!std::isfinite(override_value->value) || override_value->value <= -1.0) {
            throw InvalidConfigError(to_string(Stage::WageGrowth), override_value->field,
                                     "growth rate must be greater than -100%");
        }
        audit.record(Stage::WageGrowth, "Annual wage growth rate (user override)",
                     override_value->value, USER_OVERRIDE_LABEL, override_value->field);
        for (size_t i = 0; i < horizon; ++i) {
            schedule.entries.push_back(GrowthEntry{static_cast<unsigned>(i),
                                                   base_year + static_cast<int>(i),
                                                   override_value->value, false});
        }
        return schedule;
    }

    const std::string& category = std::get<TableLookup>(source).key;
    std::set<std::string> cited;

    for (size_t i = 0; i < horizon; ++i) {
        const int year = base_year + static_cast<int>(i);
        RateLookup lookup = table.get_rate(year, category);

        if (cited.insert(lookup.citation.locator).second) {
            std::string description = lookup.carried_forward
                ? "Wage growth rate carried forward from " + std::to_string(lookup.source_year)
                : "Wage growth rate for " + std::to_string(year);
            audit.record(Stage::WageGrowth, description, lookup.rate, lookup.citation);
        }

        schedule.entries.push_back(GrowthEntry{static_cast<unsigned>(i), year,
                                               lookup.rate, lookup.carried_forward});
    }

    return schedule;
}

// ============================================================================
// Wage history
// ============================================================================

WageHistory build_wage_history(
    double base_salary,
    int base_year,
    const RateSource& source,
    const WageGrowthTable& table,
    AuditLog& audit,
    unsigned years)
{
    WageHistory history;
    if (years == 0) {
        return history;
    }

    // growth[k] is the rate into calendar year base_year - k
    std::vector<double> growth;
    growth.reserve(years - 1);

    if (const auto* override_value = std::get_if<UserOverride>(&source)) {
        if (!std::isfinite(override_value->value) || override_value->value <= -1.0) {
            throw InvalidConfigError(to_string(Stage::WageGrowth), override_value->field,
                                     "growth rate must be greater than -100%");
        }
        if (years > 1) {
            audit.record(Stage::WageGrowth, "Historical wage growth rate (user override)",
                         override_value->value, USER_OVERRIDE_LABEL, override_value->field);
        }
        growth.assign(years - 1, override_value->value);
    } else {
        const std::string& category = std::get<TableLookup>(source).key;
        const int first_year = table.first_year(category);
        std::set<std::string> cited;

        for (unsigned k = 0; k + 1 < years; ++k) {
            const int year = base_year - static_cast<int>(k);
            if (year < first_year) {
                break;
            }
            RateLookup lookup = table.get_rate(year, category);
            if (cited.insert(lookup.citation.locator).second) {
                std::string description = lookup.carried_forward
                    ? "Historical wage growth carried forward from " + std::to_string(lookup.source_year)
                    : "Historical wage growth for " + std::to_string(year);
                audit.record(Stage::WageGrowth, description, lookup.rate, lookup.citation);
            }
            growth.push_back(lookup.rate);
        }
    }

    const size_t count = growth.size() + 1;
    history.entries.resize(count);

    double wage = base_salary;
    for (size_t i = count; i-- > 0;) {
        const size_t back = count - 1 - i;          // Years before base_year
        WageHistoryEntry& entry = history.entries[i];
        entry.year_index = static_cast<unsigned>(i);
        entry.calendar_year = base_year - static_cast<int>(back);
        entry.mean_wage = wage;
        if (i > 0) {
            entry.yoy_growth = growth[back];
            wage /= 1.0 + growth[back];
        }
    }

    return history;
}

} // namespace losscalc
