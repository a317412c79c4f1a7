#ifndef LOSSCALC_CASE_RUNNER_HPP
#define LOSSCALC_CASE_RUNNER_HPP

#include "audit_log.hpp"
#include "case_config.hpp"
#include "discounting.hpp"
#include "earnings.hpp"
#include "life_expectancy.hpp"
#include "reference_tables.hpp"
#include "wage_growth.hpp"
#include "worklife.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace losscalc {

// Everything one case run produced. Returned by value and never modified
// afterwards; the audit entries are the frozen log of the run.
struct CaseResult {
    CaseConfig config;
    double age;                     // Fractional age at evaluation date

    LifeExpectancyResult life_expectancy;
    WorkLifeResult worklife;
    GrowthSchedule wage_growth;
    WageHistory wage_history;
    EarningsSchedule earnings;
    DiscountFactorSchedule discount_factors;
    PresentValueResult present_value;

    std::vector<AuditEntry> audit_entries;

    // Summary figures
    std::optional<double> average_growth_rate;  // Override value, or mean of scheduled rates
    std::optional<double> discount_rate;        // Override value, or first-year table rate

    double life_expectancy_years() const { return life_expectancy.remaining_years; }
    double worklife_years() const { return worklife.years; }
    double total_economic_loss() const { return present_value.total; }
    double undiscounted_total() const { return earnings.total_nominal(); }

    CaseResult();
};

// Outcome of one case within a batch: a result, or the error that stopped it
struct CaseOutcome {
    std::string case_id;
    bool success;
    std::optional<CaseResult> result;
    std::string error_message;
    std::string error_stage;        // Empty unless the error carried a stage
    std::string error_key;

    CaseOutcome();
};

/**
 * CaseRunner sequences the pipeline for one or many cases.
 *
 * Stages run strictly in order: life expectancy, work-life, wage growth,
 * earnings, discounting. Each run owns its audit log; the reference
 * tables are shared read-only. A failing stage propagates its exception
 * and no partial result is returned.
 */
class CaseRunner {
public:
    explicit CaseRunner(std::shared_ptr<const ReferenceTables> tables);

    // Validate and run one case.
    // Throws InvalidConfigError, InvalidAgeError or TableLookupError.
    CaseResult run(const CaseConfig& config) const;

    // Run independent cases, concurrently when OpenMP is available.
    // Outcomes are returned in input order; failures do not stop the batch.
    std::vector<CaseOutcome> run_batch(const std::vector<CaseConfig>& configs) const;

    const ReferenceTables& tables() const { return *tables_; }

private:
    std::shared_ptr<const ReferenceTables> tables_;

    CaseResult run_case(const CaseConfig& config, size_t batch_index) const;
};

} // namespace losscalc

#endif // LOSSCALC_CASE_RUNNER_HPP
