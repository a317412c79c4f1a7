#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "discounting.hpp"
#include "errors.hpp"

using namespace losscalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

EarningsSchedule make_earnings(size_t years, double salary = 1000.0) {
    EarningsSchedule schedule;
    for (size_t i = 0; i < years; ++i) {
        schedule.entries.push_back(EarningsEntry{
            static_cast<unsigned>(i), 2025 + static_cast<int>(i), 1.0, salary, salary});
    }
    return schedule;
}

ReferenceTables make_tables() {
    DiscountRateSeries series("treasury_1y", "1-year Treasury");
    series.set_rate(2025, 0.04);
    series.set_rate(2026, 0.05);

    std::map<std::string, DiscountRateSeries> discount;
    discount.emplace("treasury_1y", series);
    return ReferenceTables(LifeTable("life"), {}, WageGrowthTable("growth"), std::move(discount));
}

} // anonymous namespace

TEST_CASE("Flat override discounts with start-of-year timing", "[discounting]") {
    ReferenceTables tables = make_tables();
    AuditLog audit;
    EarningsSchedule earnings = make_earnings(4);

    DiscountFactorSchedule factors = compute_discount_factors(
        earnings, 2025, UserOverride{0.05, "assumptions.discount_rate_override"}, tables, audit);

    REQUIRE(factors.size() == 4);
    REQUIRE(factors.entries[0].discount_factor == 1.0);
    for (size_t i = 0; i < factors.size(); ++i) {
        REQUIRE_THAT(factors.entries[i].discount_factor, WithinRel(1.0 / std::pow(1.05, i), 1e-12));
    }
    REQUIRE(*factors.nominal_rate == 0.05);
    REQUIRE(audit.size() == 1);
    REQUIRE(audit.entries()[0].source_label == USER_OVERRIDE_LABEL);
}

TEST_CASE("Factors strictly decrease for a positive rate", "[discounting][property]") {
    ReferenceTables tables = make_tables();
    AuditLog audit;

    DiscountFactorSchedule factors = compute_discount_factors(
        make_earnings(10), 2025, TableLookup{"treasury_1y"}, tables, audit);

    REQUIRE(factors.entries[0].discount_factor == 1.0);
    for (size_t i = 1; i < factors.size(); ++i) {
        REQUIRE(factors.entries[i].discount_factor < factors.entries[i - 1].discount_factor);
    }
}

TEST_CASE("Table rates chain year by year", "[discounting]") {
    ReferenceTables tables = make_tables();
    AuditLog audit;

    DiscountFactorSchedule factors = compute_discount_factors(
        make_earnings(4), 2025, TableLookup{"treasury_1y"}, tables, audit);

    REQUIRE_THAT(factors.entries[1].discount_factor, WithinRel(1.0 / 1.04, 1e-12));
    REQUIRE_THAT(factors.entries[2].discount_factor, WithinRel(1.0 / (1.04 * 1.05), 1e-12));
    REQUIRE_THAT(factors.entries[3].discount_factor, WithinRel(1.0 / (1.04 * 1.05 * 1.05), 1e-12));
    REQUIRE(*factors.nominal_rate == 0.04);

    // 2025, 2026 and the carried-forward 2026 row
    REQUIRE(audit.size() == 3);
    REQUIRE(audit.entries()[0].source_locator == "discount:treasury_1y:year=2025");
    REQUIRE(audit.entries()[2].source_locator == "discount:treasury_1y:year=2026 (carried forward)");
}

TEST_CASE("Zero discount rate keeps every factor at one", "[discounting]") {
    ReferenceTables tables = make_tables();
    AuditLog audit;
    EarningsSchedule earnings = make_earnings(7, 1234.56);

    DiscountFactorSchedule factors = compute_discount_factors(earnings, 2025, UserOverride{0.0, "x"}, tables, audit);
    PresentValueResult pv = compute_present_values(earnings, factors);

    for (const auto& entry : factors.entries) {
        REQUIRE(entry.discount_factor == 1.0);
    }
    REQUIRE(pv.total == earnings.total_nominal());
}

TEST_CASE("Present values accumulate", "[discounting]") {
    ReferenceTables tables = make_tables();
    AuditLog audit;
    EarningsSchedule earnings = make_earnings(3);

    DiscountFactorSchedule factors = compute_discount_factors(earnings, 2025, UserOverride{0.10, "x"}, tables, audit);
    PresentValueResult pv = compute_present_values(earnings, factors);

    REQUIRE(pv.entries.size() == 3);
    REQUIRE_THAT(pv.entries[1].present_value, WithinRel(1000.0 / 1.1, 1e-12));
    REQUIRE_THAT(pv.entries[2].cumulative_present_value,
                 WithinRel(1000.0 + 1000.0 / 1.1 + 1000.0 / 1.21, 1e-12));
    REQUIRE(pv.total == pv.entries.back().cumulative_present_value);
    REQUIRE(pv.total < earnings.total_nominal());
}

TEST_CASE("Empty schedule has no citations and zero total", "[discounting][boundary]") {
    ReferenceTables tables = make_tables();
    AuditLog audit;
    EarningsSchedule earnings;

    DiscountFactorSchedule factors = compute_discount_factors(earnings, 2025, TableLookup{"missing"}, tables, audit);
    PresentValueResult pv = compute_present_values(earnings, factors);

    REQUIRE(factors.empty());
    REQUIRE_FALSE(factors.nominal_rate.has_value());
    REQUIRE(pv.total == 0.0);
    REQUIRE(audit.empty());
}

TEST_CASE("Discounting failures", "[discounting][error]") {
    ReferenceTables tables = make_tables();
    AuditLog audit;
    EarningsSchedule earnings = make_earnings(2);

    REQUIRE_THROWS_AS(compute_discount_factors(earnings, 2025, UserOverride{-1.0, "x"}, tables, audit),
                      InvalidConfigError);
    REQUIRE_THROWS_AS(compute_discount_factors(earnings, 2025, TableLookup{"missing"}, tables, audit),
                      TableLookupError);
    REQUIRE_THROWS_AS(compute_discount_factors(earnings, 2020, TableLookup{"treasury_1y"}, tables, audit),
                      TableLookupError);

    DiscountFactorSchedule short_factors = compute_discount_factors(
        make_earnings(1), 2025, UserOverride{0.03, "x"}, tables, audit);
    REQUIRE_THROWS_AS(compute_present_values(earnings, short_factors), std::invalid_argument);
}

TEST_CASE("Non-finite present values are rejected", "[discounting][error]") {
    ReferenceTables tables = make_tables();
    AuditLog audit;
    EarningsSchedule earnings = make_earnings(2);
    earnings.entries[1].nominal_earnings = HUGE_VAL;

    DiscountFactorSchedule factors = compute_discount_factors(
        earnings, 2025, UserOverride{0.03, "x"}, tables, audit);

    REQUIRE_THROWS_AS(compute_present_values(earnings, factors), InvalidConfigError);
}
