#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "case_runner.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "table_provider.hpp"

using namespace losscalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

const std::string DATA_DIR = LOSSCALC_DATA_DIR;

std::shared_ptr<const ReferenceTables> bundled_tables() {
    LoggerConfig quiet;
    quiet.enable_console = false;
    Logger::get_instance().configure(quiet);

    CsvTableProvider provider(parse_table_sources_from_file(DATA_DIR + "/tables.json"));
    return load_reference_tables(provider);
}

CaseConfig sample_case() {
    return parse_case_config_from_file(DATA_DIR + "/sample_case.json");
}

} // anonymous namespace

TEST_CASE("Sample case: 45-year-old female, BA, $86,900", "[case_runner]") {
    CaseRunner runner(bundled_tables());
    CaseResult result = runner.run(sample_case());

    REQUIRE_THAT(result.age, WithinAbs(45.0, 0.01));
    REQUIRE(result.life_expectancy_years() > 0.0);
    REQUIRE(result.worklife_years() > 0.0);
    REQUIRE(result.worklife_years() <= result.life_expectancy_years());
    REQUIRE(result.worklife.method == WorkLifeMethod::TableFactor);

    REQUIRE_FALSE(result.wage_growth.empty());
    REQUIRE(result.wage_growth.size() == horizon_years(result.worklife_years()));
    REQUIRE(result.earnings.size() == result.wage_growth.size());
    REQUIRE(result.discount_factors.size() == result.earnings.size());
    REQUIRE(result.present_value.entries.size() == result.earnings.size());

    // First projection year earns the base salary and is not discounted
    REQUIRE(result.earnings.entries.front().nominal_earnings == 86900.0);
    REQUIRE(result.discount_factors.entries.front().discount_factor == 1.0);
    REQUIRE_THAT(result.earnings.total_years(), WithinAbs(result.worklife_years(), 1e-9));

    REQUIRE(result.total_economic_loss() > 0.0);
    REQUIRE(result.total_economic_loss() < result.undiscounted_total());

    REQUIRE(result.average_growth_rate.has_value());
    REQUIRE(result.discount_rate.has_value());
    REQUIRE_THAT(*result.discount_rate, WithinRel(0.037, 1e-12));
}

TEST_CASE("Present value is the sum of discounted earnings", "[case_runner]") {
    CaseRunner runner(bundled_tables());
    CaseResult result = runner.run(sample_case());

    double total = 0.0;
    for (size_t i = 0; i < result.earnings.size(); ++i) {
        const double expected = result.earnings.entries[i].nominal_earnings *
                                result.discount_factors.entries[i].discount_factor;
        REQUIRE(result.present_value.entries[i].present_value == expected);
        total += expected;
        REQUIRE(result.present_value.entries[i].cumulative_present_value == total);
    }
    REQUIRE(result.total_economic_loss() == total);

    for (size_t i = 1; i < result.discount_factors.size(); ++i) {
        REQUIRE(result.discount_factors.entries[i].discount_factor <=
                result.discount_factors.entries[i - 1].discount_factor);
    }
}

TEST_CASE("Zero life expectancy yields no loss", "[case_runner][edge]") {
    CaseRunner runner(bundled_tables());
    CaseConfig config = sample_case();
    config.assumptions.life_expectancy_years = 0.0;

    CaseResult result = runner.run(config);

    REQUIRE(result.life_expectancy_years() == 0.0);
    REQUIRE(result.worklife_years() == 0.0);
    REQUIRE(result.wage_growth.empty());
    REQUIRE(result.earnings.empty());
    REQUIRE(result.discount_factors.empty());
    REQUIRE(result.total_economic_loss() == 0.0);
    REQUIRE(result.undiscounted_total() == 0.0);
    REQUIRE(result.audit_entries.size() > 0);
}

TEST_CASE("Zero discount rate leaves earnings undiscounted", "[case_runner][edge]") {
    CaseRunner runner(bundled_tables());
    CaseConfig config = sample_case();
    config.assumptions.discount_rate = 0.0;

    CaseResult result = runner.run(config);

    for (const auto& entry : result.discount_factors.entries) {
        REQUIRE(entry.discount_factor == 1.0);
    }
    REQUIRE(result.total_economic_loss() == result.undiscounted_total());
    REQUIRE(*result.discount_rate == 0.0);
}

TEST_CASE("Flat overrides produce a closed-form schedule", "[case_runner]") {
    CaseRunner runner(bundled_tables());
    CaseConfig config = sample_case();
    config.assumptions.worklife_years = 3.0;
    config.assumptions.wage_growth_rate = 0.03;
    config.assumptions.discount_rate = 0.05;

    CaseResult result = runner.run(config);

    REQUIRE(result.worklife.method == WorkLifeMethod::Override);
    REQUIRE(result.earnings.size() == 3);
    const double expected = 86900.0 + 86900.0 * 1.03 / 1.05 + 86900.0 * 1.03 * 1.03 / (1.05 * 1.05);
    REQUIRE_THAT(result.total_economic_loss(), WithinRel(expected, 1e-12));
    REQUIRE(*result.average_growth_rate == 0.03);
    REQUIRE(*result.discount_rate == 0.05);
}

TEST_CASE("Identical inputs give identical results", "[case_runner]") {
    CaseRunner runner(bundled_tables());
    CaseConfig config = sample_case();

    CaseResult first = runner.run(config);
    CaseResult second = runner.run(config);

    REQUIRE(first.total_economic_loss() == second.total_economic_loss());
    REQUIRE(first.undiscounted_total() == second.undiscounted_total());
    REQUIRE(first.audit_entries == second.audit_entries);
    REQUIRE(first.wage_growth.entries == second.wage_growth.entries);
}

TEST_CASE("Audit log follows stage order", "[case_runner][audit]") {
    CaseRunner runner(bundled_tables());
    CaseResult result = runner.run(sample_case());

    REQUIRE_FALSE(result.audit_entries.empty());
    for (size_t i = 1; i < result.audit_entries.size(); ++i) {
        REQUIRE(result.audit_entries[i - 1].stage <= result.audit_entries[i].stage);
    }

    bool seen[5] = {false, false, false, false, false};
    for (const auto& entry : result.audit_entries) {
        seen[static_cast<size_t>(entry.stage)] = true;
        REQUIRE_FALSE(entry.source_label.empty());
        REQUIRE_FALSE(entry.source_locator.empty());
    }
    for (bool stage_seen : seen) {
        REQUIRE(stage_seen);
    }

    REQUIRE(result.audit_entries.front().source_locator.rfind("life_table:age=45", 0) == 0);
}

TEST_CASE("Audit entries match the lookups performed", "[case_runner][audit]") {
    CaseRunner runner(bundled_tables());
    CaseResult result = runner.run(sample_case());

    AuditLog counted;
    for (const auto& entry : result.audit_entries) {
        counted.record(entry.stage, entry.description, entry.value,
                       entry.source_label, entry.source_locator);
    }

    // Age 45.002: two interpolated life table rows
    REQUIRE(counted.count(Stage::LifeExpectancy) == 2);
    // One work-life participation factor
    REQUIRE(counted.count(Stage::WorkLife) == 1);
    // Projection: the 2025 row plus the same row carried forward; history: 2020-2025
    REQUIRE(result.wage_growth.size() > 1);
    REQUIRE(counted.count(Stage::WageGrowth) == 2 + 6);
    // Base salary
    REQUIRE(counted.count(Stage::Earnings) == 1);
    // The 2025 treasury row plus the same row carried forward
    REQUIRE(counted.count(Stage::Discounting) == 2);

    REQUIRE(result.audit_entries.size() == 14);
}

TEST_CASE("Result carries the life timeline and wage history", "[case_runner]") {
    CaseRunner runner(bundled_tables());
    CaseResult result = runner.run(sample_case());

    double lived = 0.0;
    for (double fraction : result.life_expectancy.timeline) {
        lived += fraction;
    }
    REQUIRE_THAT(lived, WithinAbs(result.life_expectancy_years(), 1e-6));

    REQUIRE(result.wage_history.size() == WAGE_HISTORY_YEARS);
    REQUIRE(result.wage_history.entries.back().calendar_year == 2025);
    REQUIRE(result.wage_history.entries.back().mean_wage == 86900.0);
    REQUIRE(result.wage_history.entries.front().mean_wage < 86900.0);
}

TEST_CASE("Extreme growth override fails instead of producing infinities", "[case_runner][error]") {
    CaseRunner runner(bundled_tables());
    CaseConfig config = sample_case();
    config.assumptions.wage_growth_rate = 1e200;

    REQUIRE_THROWS_AS(runner.run(config), InvalidConfigError);
}

TEST_CASE("Overrides are cited as user overrides", "[case_runner][audit]") {
    CaseRunner runner(bundled_tables());
    CaseConfig config = sample_case();
    config.assumptions.discount_rate = 0.04;

    CaseResult result = runner.run(config);

    size_t overrides = 0;
    for (const auto& entry : result.audit_entries) {
        if (entry.stage == Stage::Discounting) {
            REQUIRE(entry.source_label == USER_OVERRIDE_LABEL);
            REQUIRE(entry.source_locator == "assumptions.discount_rate_override");
            ++overrides;
        }
    }
    REQUIRE(overrides == 1);
}

TEST_CASE("Inactive person has no lost earnings", "[case_runner][edge]") {
    CaseRunner runner(bundled_tables());
    CaseConfig config = sample_case();
    config.person.active_status = ActiveStatus::Inactive;

    CaseResult result = runner.run(config);

    REQUIRE(result.life_expectancy_years() > 0.0);
    REQUIRE(result.worklife.method == WorkLifeMethod::Inactive);
    REQUIRE(result.worklife_years() == 0.0);
    REQUIRE(result.earnings.empty());
    REQUIRE(result.total_economic_loss() == 0.0);
    REQUIRE_FALSE(result.average_growth_rate.has_value());
}

TEST_CASE("Invalid cases fail before any stage runs", "[case_runner][error]") {
    CaseRunner runner(bundled_tables());

    SECTION("Evaluation date before birth") {
        CaseConfig config = sample_case();
        config.person.evaluation_date = Date(1979, 12, 31);
        REQUIRE_THROWS_AS(runner.run(config), InvalidConfigError);
    }

    SECTION("Non-positive salary") {
        CaseConfig config = sample_case();
        config.occupation.base_salary = 0.0;
        REQUIRE_THROWS_AS(runner.run(config), InvalidConfigError);
    }

    SECTION("Age beyond the life table") {
        CaseConfig config = sample_case();
        config.person.date_of_birth = Date(1880, 1, 1);
        REQUIRE_THROWS_AS(runner.run(config), InvalidAgeError);
    }

    SECTION("Unknown discount series") {
        CaseConfig config = sample_case();
        config.assumptions.discount_series = "libor";
        REQUIRE_THROWS_AS(runner.run(config), TableLookupError);
    }
}

TEST_CASE("Batch keeps input order and isolates failures", "[case_runner][batch]") {
    CaseRunner runner(bundled_tables());

    CaseConfig first = sample_case();
    first.case_id = "first";

    CaseConfig broken = sample_case();
    broken.case_id = "broken";
    broken.assumptions.wage_growth_category = "99";

    CaseConfig third = sample_case();
    third.case_id = "third";
    third.assumptions.discount_rate = 0.0;

    std::vector<CaseOutcome> outcomes = runner.run_batch({first, broken, third});

    REQUIRE(outcomes.size() == 3);
    REQUIRE(outcomes[0].case_id == "first");
    REQUIRE(outcomes[0].success);
    REQUIRE(outcomes[0].result.has_value());

    REQUIRE(outcomes[1].case_id == "broken");
    REQUIRE_FALSE(outcomes[1].success);
    REQUIRE_FALSE(outcomes[1].result.has_value());
    REQUIRE(outcomes[1].error_stage == "wage_growth");
    REQUIRE(outcomes[1].error_key == "wage_growth:99");
    REQUIRE_FALSE(outcomes[1].error_message.empty());

    REQUIRE(outcomes[2].success);
    REQUIRE(outcomes[2].result->total_economic_loss() == outcomes[2].result->undiscounted_total());

    CaseResult single = runner.run(first);
    REQUIRE(outcomes[0].result->total_economic_loss() == single.total_economic_loss());
}

TEST_CASE("CaseRunner requires tables", "[case_runner][error]") {
    REQUIRE_THROWS_AS(CaseRunner(nullptr), std::invalid_argument);
}
