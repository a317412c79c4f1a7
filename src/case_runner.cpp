#include "case_runner.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace losscalc {

namespace {

std::optional<double> summary_growth_rate(const RateSource& source, const GrowthSchedule& schedule) {
    if (const auto* override_value = std::get_if<UserOverride>(&source)) {
        return override_value->value;
    }
    return schedule.average_rate();
}

std::optional<double> summary_discount_rate(const RateSource& source,
                                            const DiscountFactorSchedule& schedule) {
    if (const auto* override_value = std::get_if<UserOverride>(&source)) {
        return override_value->value;
    }
    return schedule.nominal_rate;
}

} // anonymous namespace

CaseResult::CaseResult() : age(0.0) {}

CaseOutcome::CaseOutcome() : success(false) {}

CaseRunner::CaseRunner(std::shared_ptr<const ReferenceTables> tables)
    : tables_(std::move(tables))
{
    if (!tables_) {
        throw std::invalid_argument("CaseRunner requires reference tables");
    }
}

CaseResult CaseRunner::run(const CaseConfig& config) const {
    return run_case(config, 0);
}

// ============================================================================
// Pipeline
// ============================================================================

CaseResult CaseRunner::run_case(const CaseConfig& config, size_t batch_index) const {
    Logger& logger = Logger::get_instance();
    CaseContext ctx(config.case_id, batch_index);
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        config.validate();

        CaseResult result;
        result.config = config;
        result.age = config.age_at_evaluation();
        logger.log_case_start(ctx, result.age);

        AuditLog audit;
        const Person& person = config.person;
        const int base_year = person.evaluation_date.year;

        // Stage 1: life expectancy
        result.life_expectancy = resolve_life_expectancy(
            result.age, person.sex, life_expectancy_source(config),
            tables_->life_table(), audit);
        logger.log_stage_complete(ctx, Stage::LifeExpectancy, audit.count(Stage::LifeExpectancy),
                                  result.life_expectancy.remaining_years);

        // Stage 2: work-life
        result.worklife = resolve_worklife(
            result.life_expectancy, person.sex, person.education,
            worklife_source(config), *tables_, audit);
        logger.log_stage_complete(ctx, Stage::WorkLife, audit.count(Stage::WorkLife),
                                  result.worklife.years);
        if (result.worklife.clamped) {
            logger.log_warning(ctx, "Work-life capped at remaining life expectancy");
        }

        // Stage 3: wage growth
        const RateSource growth_source = wage_growth_source(config);
        result.wage_growth = project_wage_growth(
            base_year, horizon_years(result.worklife.years), growth_source,
            tables_->wage_growth_table(), audit);
        result.wage_history = build_wage_history(
            config.occupation.base_salary, base_year, growth_source,
            tables_->wage_growth_table(), audit);
        logger.log_stage_complete(ctx, Stage::WageGrowth, audit.count(Stage::WageGrowth),
                                  static_cast<double>(result.wage_growth.size()));

        // Stage 4: earnings
        result.earnings = project_earnings(
            config.occupation.base_salary, result.wage_growth, result.worklife.years,
            person.evaluation_date, audit);
        logger.log_stage_complete(ctx, Stage::Earnings, audit.count(Stage::Earnings),
                                  result.earnings.total_nominal());

        // Stage 5: discounting
        const RateSource rate_source = discount_source(config);
        result.discount_factors = compute_discount_factors(
            result.earnings, base_year, rate_source, *tables_, audit);
        result.present_value = compute_present_values(result.earnings, result.discount_factors);
        logger.log_stage_complete(ctx, Stage::Discounting, audit.count(Stage::Discounting),
                                  result.present_value.total);

        result.average_growth_rate = summary_growth_rate(growth_source, result.wage_growth);
        result.discount_rate = summary_discount_rate(rate_source, result.discount_factors);
        result.audit_entries = audit.freeze();

        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        logger.log_case_complete(ctx, result.present_value.total, result.audit_entries.size(),
                                 elapsed_ms);
        return result;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        throw;
    }
}

// ============================================================================
// Batch
// ============================================================================

std::vector<CaseOutcome> CaseRunner::run_batch(const std::vector<CaseConfig>& configs) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    std::vector<CaseOutcome> outcomes(configs.size());
    const long count = static_cast<long>(configs.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (long i = 0; i < count; ++i) {
        const size_t index = static_cast<size_t>(i);
        CaseOutcome& outcome = outcomes[index];
        outcome.case_id = configs[index].case_id;
        try {
            outcome.result = run_case(configs[index], index);
            outcome.success = true;
        } catch (const LossCalcError& e) {
            outcome.error_message = e.what();
            outcome.error_stage = e.stage();
            outcome.error_key = e.key();
        } catch (const std::exception& e) {
            outcome.error_message = e.what();
        }
    }

    size_t failures = 0;
    for (const auto& outcome : outcomes) {
        if (!outcome.success) {
            ++failures;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    Logger::get_instance().log_batch_complete(
        outcomes.size(), failures,
        std::chrono::duration<double, std::milli>(end_time - start_time).count());
    return outcomes;
}

} // namespace losscalc
