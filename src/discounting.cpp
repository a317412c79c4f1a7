#include "discounting.hpp"
#include "errors.hpp"
#include <cmath>
#include <set>
#include <stdexcept>

namespace losscalc {

namespace {

void require_valid_rate(double rate, const std::string& key) {
    if (!std::isfinite(rate) || rate <= -1.0) {
        throw InvalidConfigError(to_string(Stage::Discounting), key,
                                 "discount rate must be greater than -100%");
    }
}

} // anonymous namespace

// ============================================================================
// Discount Factors
// ============================================================================

DiscountFactorSchedule compute_discount_factors(
    const EarningsSchedule& earnings,
    int base_year,
    const RateSource& source,
    const ReferenceTables& tables,
    AuditLog& audit)
{
    DiscountFactorSchedule schedule;
    if (earnings.empty()) {
        return schedule;
    }
    schedule.entries.reserve(earnings.size());

    if (const auto* override_value = std::get_if<UserOverride>(&source)) {
        const double rate = override_value->value;
        require_valid_rate(rate, override_value->field);
        audit.record(Stage::Discounting, "Discount rate (user override)", rate,
                     USER_OVERRIDE_LABEL, override_value->field);

        for (const auto& entry : earnings.entries) {
            double factor = 1.0 / std::pow(1.0 + rate, static_cast<double>(entry.year_index));
            schedule.entries.push_back(DiscountFactorEntry{
                entry.year_index, base_year + static_cast<int>(entry.year_index), rate, factor});
        }
        schedule.nominal_rate = rate;
        return schedule;
    }

    const DiscountRateSeries& series = tables.discount_series(std::get<TableLookup>(source).key);
    std::set<std::string> cited;
    double factor = 1.0;

    for (const auto& entry : earnings.entries) {
        const int year = base_year + static_cast<int>(entry.year_index);
        RateLookup lookup = series.get_rate(year);
        require_valid_rate(lookup.rate, lookup.citation.locator);

        if (cited.insert(lookup.citation.locator).second) {
            std::string description = lookup.carried_forward
                ? "Discount rate carried forward from " + std::to_string(lookup.source_year)
                : "Discount rate for " + std::to_string(year);
            audit.record(Stage::Discounting, description, lookup.rate, lookup.citation);
        }

        schedule.entries.push_back(DiscountFactorEntry{entry.year_index, year, lookup.rate, factor});
        factor /= 1.0 + lookup.rate;
    }

    schedule.nominal_rate = schedule.entries.front().rate;
    return schedule;
}

// ============================================================================
// Present Values
// ============================================================================

PresentValueResult compute_present_values(
    const EarningsSchedule& earnings,
    const DiscountFactorSchedule& factors)
{
    if (earnings.size() != factors.size()) {
        throw std::invalid_argument(
            "Earnings schedule has " + std::to_string(earnings.size()) +
            " entries but discount schedule has " + std::to_string(factors.size()));
    }

    PresentValueResult result;
    result.entries.reserve(earnings.size());
    double cumulative = 0.0;

    for (size_t i = 0; i < earnings.size(); ++i) {
        const EarningsEntry& e = earnings.entries[i];
        const DiscountFactorEntry& d = factors.entries[i];
        double pv = e.nominal_earnings * d.discount_factor;
        if (!std::isfinite(pv)) {
            throw InvalidConfigError(to_string(Stage::Discounting),
                                     "year=" + std::to_string(e.calendar_year),
                                     "present value is not a finite number");
        }
        cumulative += pv;
        result.entries.push_back(PresentValueEntry{
            e.year_index, e.calendar_year, e.year_fraction,
            e.nominal_earnings, d.discount_factor, pv, cumulative});
    }

    result.total = cumulative;
    return result;
}

} // namespace losscalc
