#ifndef LOSSCALC_WORKLIFE_HPP
#define LOSSCALC_WORKLIFE_HPP

#include "audit_log.hpp"
#include "case_config.hpp"
#include "life_expectancy.hpp"
#include "reference_tables.hpp"
#include <string>

namespace losscalc {

enum class WorkLifeMethod : uint8_t {
    Inactive = 0,                   // Not in the labor force: zero years
    Override = 1,                   // Years supplied by the case
    RetirementAge = 2,              // Retirement-age hint minus current age
    TableFactor = 3                 // Participation factor x life expectancy
};

std::string to_string(WorkLifeMethod method);

struct WorkLifeResult {
    double years;                   // Resolved work-life years, <= life expectancy
    double unclamped_years;         // Value before the life-expectancy cap
    bool clamped;
    WorkLifeMethod method;
    double factor;                  // TableFactor only
    std::string table_name;         // TableFactor only
    unsigned bracket_min_age;       // TableFactor only
    unsigned bracket_max_age;       // TableFactor only

    WorkLifeResult();
};

// Convert remaining life expectancy into remaining labor-force years.
//
// Inactive status wins over everything else. An override or a
// retirement-age hint is used as given, and table factors are multiplied
// by life expectancy; in every case the result is capped at life
// expectancy. Table rows are keyed by the bracket containing floor(age).
//
// Throws TableLookupError for an unknown table or a missing bracket.
WorkLifeResult resolve_worklife(
    const LifeExpectancyResult& life,
    Sex sex,
    EducationLevel education,
    const WorkLifeSource& source,
    const ReferenceTables& tables,
    AuditLog& audit
);

} // namespace losscalc

#endif // LOSSCALC_WORKLIFE_HPP
