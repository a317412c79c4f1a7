#ifndef LOSSCALC_REFERENCE_TABLES_HPP
#define LOSSCALC_REFERENCE_TABLES_HPP

#include "case_config.hpp"
#include <array>
#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace losscalc {

// Where a value came from: publication/source label plus a row locator
// such as "life_table:age=45:female"
struct Citation {
    std::string source_label;
    std::string locator;

    bool operator==(const Citation& other) const;
};

// A looked-up value together with its citation
struct TableValue {
    double value;
    Citation citation;
};

// Result of a year-indexed rate lookup. Years past the last table year
// reuse the last known rate; carried_forward marks those.
struct RateLookup {
    double rate;
    int source_year;                // Table year the rate was taken from
    bool carried_forward;
    Citation citation;
};

// LifeTable: remaining life expectancy e(x) by integer age and sex.
// Rows must be contiguous from age 0 up to max_age().
class LifeTable {
public:
    static constexpr size_t MAX_SUPPORTED_AGE = 120;
    static constexpr size_t NUM_AGES = MAX_SUPPORTED_AGE + 1;
    static constexpr size_t NUM_SEXES = 2;

    LifeTable();
    explicit LifeTable(const std::string& source_label);

    void set_ex(unsigned age, Sex sex, double ex);

    // Throws TableLookupError if the row was never set
    TableValue get_ex(unsigned age, Sex sex) const;

    bool has_row(unsigned age, Sex sex) const;

    // Highest age with both sexes populated; throws TableLookupError on an empty table
    unsigned max_age() const;

    const std::string& source_label() const { return source_label_; }

    // Load from CSV: expects columns age,male_ex,female_ex
    static LifeTable load_from_csv(const std::string& filepath, const std::string& source_label);
    static LifeTable load_from_csv(std::istream& is, const std::string& source_label);

private:
    std::string source_label_;
    // ex_[sex][age]; NaN marks a missing row
    std::array<std::array<double, NUM_AGES>, NUM_SEXES> ex_;
};

// One bracket of a work-life table
struct WorkLifeRow {
    unsigned age_min;
    unsigned age_max;               // Inclusive
    Sex sex;
    EducationLevel education;
    double factor;                  // Work-life years per year of life expectancy, 0.0-1.0
};

// WorkLifeTable: participation-adjustment factors keyed by
// (age bracket, sex, education)
class WorkLifeTable {
public:
    WorkLifeTable();
    WorkLifeTable(const std::string& name, const std::string& source_label);

    // Throws std::invalid_argument for bad factors, inverted or overlapping brackets
    void add_row(const WorkLifeRow& row);

    // Factor for the bracket containing age; throws TableLookupError if none
    TableValue get_factor(unsigned age, Sex sex, EducationLevel education) const;

    const WorkLifeRow& find_row(unsigned age, Sex sex, EducationLevel education) const;

    const std::string& name() const { return name_; }
    const std::string& source_label() const { return source_label_; }
    const std::vector<WorkLifeRow>& rows() const { return rows_; }

    // Load from CSV: expects columns age_min,age_max,sex,education,factor
    static WorkLifeTable load_from_csv(const std::string& filepath, const std::string& name,
                                       const std::string& source_label);
    static WorkLifeTable load_from_csv(std::istream& is, const std::string& name,
                                       const std::string& source_label);

private:
    std::string name_;
    std::string source_label_;
    std::vector<WorkLifeRow> rows_;

    std::string locator(const WorkLifeRow& row) const;
};

// WageGrowthTable: annual wage growth rate by calendar year and category
// (SOC major group such as "11", or "all")
class WageGrowthTable {
public:
    WageGrowthTable();
    explicit WageGrowthTable(const std::string& source_label);

    void set_rate(int year, const std::string& category, double rate);

    // Throws TableLookupError for unknown categories or years before coverage
    RateLookup get_rate(int year, const std::string& category) const;

    bool has_category(const std::string& category) const;

    // Earliest table year for the category; throws TableLookupError if unknown
    int first_year(const std::string& category) const;
    std::vector<std::string> categories() const;

    const std::string& source_label() const { return source_label_; }

    // Load from CSV: expects columns year,category,rate
    static WageGrowthTable load_from_csv(const std::string& filepath, const std::string& source_label);
    static WageGrowthTable load_from_csv(std::istream& is, const std::string& source_label);

private:
    std::string source_label_;
    std::map<std::string, std::map<int, double>> rates_;
};

// DiscountRateSeries: named series of annual discount rates by calendar year
class DiscountRateSeries {
public:
    DiscountRateSeries();
    DiscountRateSeries(const std::string& name, const std::string& source_label);

    void set_rate(int year, double rate);

    // Throws TableLookupError for years before coverage or an empty series
    RateLookup get_rate(int year) const;

    const std::string& name() const { return name_; }
    const std::string& source_label() const { return source_label_; }
    size_t size() const { return rates_.size(); }

    // Load from CSV: expects columns year,rate
    static DiscountRateSeries load_from_csv(const std::string& filepath, const std::string& name,
                                            const std::string& source_label);
    static DiscountRateSeries load_from_csv(std::istream& is, const std::string& name,
                                            const std::string& source_label);

private:
    std::string name_;
    std::string source_label_;
    std::map<int, double> rates_;
};

/**
 * ReferenceTables holds every table a case run may consult.
 *
 * Built once (see table_provider.hpp) and shared read-only across runs.
 * Named lookups of work-life tables and discount series throw
 * TableLookupError when the name is unknown.
 */
class ReferenceTables {
public:
    ReferenceTables(LifeTable life_table,
                    std::map<std::string, WorkLifeTable> worklife_tables,
                    WageGrowthTable wage_growth,
                    std::map<std::string, DiscountRateSeries> discount_series);

    const LifeTable& life_table() const { return life_table_; }
    const WorkLifeTable& worklife_table(const std::string& name) const;
    const WageGrowthTable& wage_growth_table() const { return wage_growth_; }
    const DiscountRateSeries& discount_series(const std::string& name) const;

    std::vector<std::string> worklife_table_names() const;
    std::vector<std::string> discount_series_names() const;

private:
    LifeTable life_table_;
    std::map<std::string, WorkLifeTable> worklife_tables_;
    WageGrowthTable wage_growth_;
    std::map<std::string, DiscountRateSeries> discount_series_;
};

} // namespace losscalc

#endif // LOSSCALC_REFERENCE_TABLES_HPP
