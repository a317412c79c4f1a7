#include "life_expectancy.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>

namespace losscalc {

namespace {

std::string format_age(double age) {
    std::ostringstream oss;
    oss << age;
    return oss.str();
}

} // anonymous namespace

std::vector<double> year_fraction_timeline(double years) {
    std::vector<double> timeline;
    if (!(years > 0.0)) {
        return timeline;
    }
    const double whole = std::floor(years);
    timeline.assign(static_cast<size_t>(whole), 1.0);
    const double remainder = years - whole;
    if (remainder > TIMELINE_EPSILON) {
        timeline.push_back(remainder);
    }
    return timeline;
}

LifeExpectancyResult::LifeExpectancyResult()
    : age(0.0), remaining_years(0.0), from_override(false) {}

LifeExpectancyResult resolve_life_expectancy(
    double age,
    Sex sex,
    const LifeExpectancySource& source,
    const LifeTable& table,
    AuditLog& audit)
{
    LifeExpectancyResult result;
    result.age = age;

    if (const auto* override_value = std::get_if<UserOverride>(&source)) {
        if (!std::isfinite(override_value->value) || override_value->value < 0.0) {
            throw InvalidConfigError(to_string(Stage::LifeExpectancy), override_value->field,
                                     "life expectancy override must be a non-negative number");
        }
        result.remaining_years = override_value->value;
        result.from_override = true;
        result.timeline = year_fraction_timeline(result.remaining_years);
        audit.record(Stage::LifeExpectancy, "Remaining life expectancy (user override)",
                     override_value->value, USER_OVERRIDE_LABEL, override_value->field);
        return result;
    }

    if (!std::isfinite(age) || age < 0.0) {
        throw InvalidAgeError(to_string(Stage::LifeExpectancy), "age=" + format_age(age),
                              "age cannot be negative");
    }
    const unsigned max_age = table.max_age();
    if (age > static_cast<double>(max_age)) {
        throw InvalidAgeError(to_string(Stage::LifeExpectancy), "age=" + format_age(age),
                              "age exceeds life table maximum " + std::to_string(max_age));
    }

    const unsigned lower_age = static_cast<unsigned>(std::floor(age));
    const double fraction = age - static_cast<double>(lower_age);

    TableValue lower = table.get_ex(lower_age, sex);
    if (fraction == 0.0) {
        result.remaining_years = lower.value;
        result.rows.push_back(LifeTableRowUse{lower_age, lower.value, 1.0, lower.citation});
    } else {
        TableValue upper = table.get_ex(lower_age + 1, sex);
        result.remaining_years = lower.value + fraction * (upper.value - lower.value);
        result.rows.push_back(LifeTableRowUse{lower_age, lower.value, 1.0 - fraction, lower.citation});
        result.rows.push_back(LifeTableRowUse{lower_age + 1, upper.value, fraction, upper.citation});
    }

    result.timeline = year_fraction_timeline(result.remaining_years);

    for (const auto& row : result.rows) {
        audit.record(Stage::LifeExpectancy,
                     "Life table e(x) at age " + std::to_string(row.age) + ", weight " +
                     format_age(row.weight),
                     row.ex, row.citation);
    }

    return result;
}

} // namespace losscalc
