#include "worklife.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace losscalc {

std::string to_string(WorkLifeMethod method) {
    switch (method) {
        case WorkLifeMethod::Inactive: return "inactive";
        case WorkLifeMethod::Override: return "override";
        case WorkLifeMethod::RetirementAge: return "retirement_age";
        case WorkLifeMethod::TableFactor: return "table_factor";
    }
    return "unknown";
}

WorkLifeResult::WorkLifeResult()
    : years(0.0),
      unclamped_years(0.0),
      clamped(false),
      method(WorkLifeMethod::Inactive),
      factor(0.0),
      bracket_min_age(0),
      bracket_max_age(0) {}

WorkLifeResult resolve_worklife(
    const LifeExpectancyResult& life,
    Sex sex,
    EducationLevel education,
    const WorkLifeSource& source,
    const ReferenceTables& tables,
    AuditLog& audit)
{
    WorkLifeResult result;

    if (std::holds_alternative<InactiveStatus>(source)) {
        result.method = WorkLifeMethod::Inactive;
        audit.record(Stage::WorkLife, "Inactive status: no remaining work-life", 0.0,
                     CASE_CONFIG_LABEL, "person.active_status");
        return result;
    }

    if (const auto* override_value = std::get_if<UserOverride>(&source)) {
        if (!std::isfinite(override_value->value) || override_value->value < 0.0) {
            throw InvalidConfigError(to_string(Stage::WorkLife), override_value->field,
                                     "work-life override must be a non-negative number");
        }
        result.method = WorkLifeMethod::Override;
        result.unclamped_years = override_value->value;
        audit.record(Stage::WorkLife, "Work-life years (user override)", override_value->value,
                     USER_OVERRIDE_LABEL, override_value->field);
    } else if (const auto* hint = std::get_if<RetirementAgeHint>(&source)) {
        result.method = WorkLifeMethod::RetirementAge;
        result.unclamped_years = std::max(0.0, hint->retirement_age - life.age);
        audit.record(Stage::WorkLife, "Retirement age hint", hint->retirement_age,
                     hint->defaulted ? "default assumption" : CASE_CONFIG_LABEL,
                     "assumptions.retirement_age_hint");
    } else {
        const auto& lookup = std::get<TableLookup>(source);
        const WorkLifeTable& table = tables.worklife_table(lookup.key);

        const unsigned age = static_cast<unsigned>(std::floor(std::max(0.0, life.age)));
        const WorkLifeRow& row = table.find_row(age, sex, education);
        TableValue factor = table.get_factor(age, sex, education);

        result.method = WorkLifeMethod::TableFactor;
        result.factor = factor.value;
        result.table_name = table.name();
        result.bracket_min_age = row.age_min;
        result.bracket_max_age = row.age_max;
        result.unclamped_years = factor.value * life.remaining_years;
        audit.record(Stage::WorkLife, "Work-life participation factor", factor.value, factor.citation);
    }

    // Nobody works longer than they live
    result.clamped = result.unclamped_years > life.remaining_years;
    result.years = std::min(result.unclamped_years, life.remaining_years);
    return result;
}

} // namespace losscalc
