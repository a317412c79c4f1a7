#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "case_config.hpp"
#include "errors.hpp"

using namespace losscalc;
using Catch::Matchers::WithinAbs;

namespace {

CaseConfig make_config() {
    CaseConfig config;
    config.case_id = "case_001";
    config.person.date_of_birth = Date(1980, 1, 1);
    config.person.evaluation_date = Date(2025, 1, 1);
    config.person.sex = Sex::Female;
    config.person.education = EducationLevel::Bachelors;
    config.occupation.soc_code = "11-2022";
    config.occupation.base_salary = 86900.0;
    return config;
}

} // anonymous namespace

// ============================================================================
// Enum parsing
// ============================================================================

TEST_CASE("Enum spellings from case files", "[case_config]") {
    REQUIRE(parse_sex("male") == Sex::Male);
    REQUIRE(parse_sex("Female") == Sex::Female);
    REQUIRE(parse_sex("F") == Sex::Female);
    REQUIRE(parse_education("HS") == EducationLevel::HighSchool);
    REQUIRE(parse_education("SomeCollege") == EducationLevel::SomeCollege);
    REQUIRE(parse_education("ba") == EducationLevel::Bachelors);
    REQUIRE(parse_education("PhD") == EducationLevel::Doctorate);
    REQUIRE(parse_active_status("inactive") == ActiveStatus::Inactive);

    REQUIRE(to_string(EducationLevel::Masters) == "MA");
    REQUIRE(to_string(Sex::Male) == "male");
    REQUIRE(to_string(ActiveStatus::Active) == "active");
}

TEST_CASE("Unknown enum spellings throw InvalidConfigError", "[case_config][error]") {
    REQUIRE_THROWS_AS(parse_sex("x"), InvalidConfigError);
    REQUIRE_THROWS_AS(parse_education("Masters"), InvalidConfigError);
    REQUIRE_THROWS_AS(parse_active_status("retired"), InvalidConfigError);
}

// ============================================================================
// Date
// ============================================================================

TEST_CASE("Date parses ISO dates", "[date]") {
    Date d = Date::parse("2024-02-29");
    REQUIRE(d.year == 2024);
    REQUIRE(d.month == 2);
    REQUIRE(d.day == 29);
    REQUIRE(d.to_iso() == "2024-02-29");
}

TEST_CASE("Date rejects malformed and impossible dates", "[date][error]") {
    REQUIRE_THROWS_AS(Date::parse("2023-02-29"), InvalidConfigError);
    REQUIRE_THROWS_AS(Date::parse("2023-13-01"), InvalidConfigError);
    REQUIRE_THROWS_AS(Date::parse("2023-1-01"), InvalidConfigError);
    REQUIRE_THROWS_AS(Date::parse("01/01/2023"), InvalidConfigError);
    REQUIRE_THROWS_AS(Date::parse(""), InvalidConfigError);
}

TEST_CASE("Date ordering and epoch days", "[date]") {
    REQUIRE(Date(1970, 1, 1).days_since_epoch() == 0);
    REQUIRE(Date(2000, 3, 1).days_since_epoch() == 11017);
    REQUIRE(Date(1969, 12, 31).days_since_epoch() == -1);

    REQUIRE(Date(2024, 1, 1) < Date(2024, 1, 2));
    REQUIRE(Date(2024, 1, 1) <= Date(2024, 1, 1));
    REQUIRE(Date(2024, 1, 1) == Date(2024, 1, 1));
}

TEST_CASE("Age is elapsed days over 365.25", "[date]") {
    // 1980-01-01 to 2025-01-01 is 16437 days
    REQUIRE_THAT(age_in_years(Date(1980, 1, 1), Date(2025, 1, 1)), WithinAbs(16437.0 / 365.25, 1e-12));
    REQUIRE(age_in_years(Date(2025, 1, 1), Date(2025, 1, 1)) == 0.0);
}

// ============================================================================
// Occupation / validation
// ============================================================================

TEST_CASE("SOC major group is the first two digits", "[case_config]") {
    Occupation occupation;
    occupation.soc_code = "11-2022";
    REQUIRE(occupation.soc_major_group() == "11");

    occupation.soc_code = "X1";
    REQUIRE_THROWS_AS(occupation.soc_major_group(), InvalidConfigError);
}

TEST_CASE("A well-formed case validates", "[case_config]") {
    CaseConfig config = make_config();
    REQUIRE_NOTHROW(config.validate());
    REQUIRE_THAT(config.age_at_evaluation(), WithinAbs(45.0, 0.01));
}

TEST_CASE("Validation rejects malformed cases", "[case_config][error]") {
    CaseConfig config = make_config();

    SECTION("Birth after evaluation date") {
        config.person.date_of_birth = Date(2026, 1, 1);
        REQUIRE_THROWS_AS(config.validate(), InvalidConfigError);
    }

    SECTION("Non-positive salary") {
        config.occupation.base_salary = 0.0;
        REQUIRE_THROWS_AS(config.validate(), InvalidConfigError);
    }

    SECTION("Negative life expectancy override") {
        config.assumptions.life_expectancy_years = -1.0;
        REQUIRE_THROWS_AS(config.validate(), InvalidConfigError);
    }

    SECTION("Discount rate at -100%") {
        config.assumptions.discount_rate = -1.0;
        REQUIRE_THROWS_AS(config.validate(), InvalidConfigError);
    }

    SECTION("Growth override below -100%") {
        config.assumptions.wage_growth_rate = -1.5;
        REQUIRE_THROWS_AS(config.validate(), InvalidConfigError);
    }

    SECTION("SOC code without a major group and no growth override") {
        config.occupation.soc_code = "";
        REQUIRE_THROWS_AS(config.validate(), InvalidConfigError);

        config.assumptions.wage_growth_rate = 0.03;
        REQUIRE_NOTHROW(config.validate());
    }
}

TEST_CASE("Validation error names the offending field", "[case_config][error]") {
    CaseConfig config = make_config();
    config.occupation.base_salary = -5.0;

    try {
        config.validate();
        FAIL("expected InvalidConfigError");
    } catch (const InvalidConfigError& e) {
        REQUIRE(e.stage() == "config");
        REQUIRE(e.key() == "occupation.base_salary_usd");
    }
}

// ============================================================================
// Source choices
// ============================================================================

TEST_CASE("Life expectancy source prefers the override", "[case_config][source]") {
    CaseConfig config = make_config();
    REQUIRE(std::holds_alternative<TableLookup>(life_expectancy_source(config)));

    config.assumptions.life_expectancy_years = 30.0;
    auto source = life_expectancy_source(config);
    REQUIRE(std::get<UserOverride>(source).value == 30.0);
}

TEST_CASE("Work-life source order", "[case_config][source]") {
    CaseConfig config = make_config();

    SECTION("Default table") {
        auto source = worklife_source(config);
        REQUIRE(std::get<TableLookup>(source).key == "default");
    }

    SECTION("Named table") {
        config.assumptions.worklife_table = "alt";
        REQUIRE(std::get<TableLookup>(worklife_source(config)).key == "alt");
    }

    SECTION("Retirement-age selector uses the hint, defaulting to 65") {
        config.assumptions.worklife_table = std::string(RETIREMENT_AGE_METHOD);
        auto defaulted = std::get<RetirementAgeHint>(worklife_source(config));
        REQUIRE(defaulted.retirement_age == 65.0);
        REQUIRE(defaulted.defaulted);

        config.assumptions.retirement_age_hint = 67.0;
        auto hinted = std::get<RetirementAgeHint>(worklife_source(config));
        REQUIRE(hinted.retirement_age == 67.0);
        REQUIRE_FALSE(hinted.defaulted);
    }

    SECTION("Override beats the table selector") {
        config.assumptions.worklife_table = std::string(RETIREMENT_AGE_METHOD);
        config.assumptions.worklife_years = 12.0;
        REQUIRE(std::get<UserOverride>(worklife_source(config)).value == 12.0);
    }

    SECTION("Inactive beats everything") {
        config.assumptions.worklife_years = 12.0;
        config.person.active_status = ActiveStatus::Inactive;
        REQUIRE(std::holds_alternative<InactiveStatus>(worklife_source(config)));
    }
}

TEST_CASE("Rate sources", "[case_config][source]") {
    CaseConfig config = make_config();

    REQUIRE(std::get<TableLookup>(wage_growth_source(config)).key == "11");
    REQUIRE(std::get<TableLookup>(discount_source(config)).key == "treasury_1y");

    config.assumptions.wage_growth_category = "all";
    config.assumptions.discount_series = "treasury_10y";
    REQUIRE(std::get<TableLookup>(wage_growth_source(config)).key == "all");
    REQUIRE(std::get<TableLookup>(discount_source(config)).key == "treasury_10y");

    config.assumptions.wage_growth_rate = 0.03;
    config.assumptions.discount_rate = 0.05;
    REQUIRE(std::get<UserOverride>(wage_growth_source(config)).field == "assumptions.annual_growth_rate_override");
    REQUIRE(std::get<UserOverride>(discount_source(config)).value == 0.05);
}
