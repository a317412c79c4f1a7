#include "reference_tables.hpp"
#include "errors.hpp"
#include "stage.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace losscalc {

namespace {

const double MISSING = std::numeric_limits<double>::quiet_NaN();

size_t column_index(const std::vector<std::string>& header, const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    return static_cast<size_t>(std::distance(header.begin(), it));
}

std::string format_rate(double rate) {
    std::ostringstream oss;
    oss << rate;
    return oss.str();
}

// Shared by wage growth and discount series: exact year, or the last
// table year carried forward when the request runs past coverage
RateLookup lookup_year(const std::map<int, double>& rates, int year,
                       const std::string& source_label, const std::string& table_key,
                       Stage stage) {
    if (rates.empty()) {
        throw TableLookupError(to_string(stage), table_key, "table has no rows");
    }

    int first_year = rates.begin()->first;
    int last_year = rates.rbegin()->first;
    if (year < first_year) {
        throw TableLookupError(to_string(stage), table_key + ":year=" + std::to_string(year),
                               "year precedes table coverage starting " + std::to_string(first_year));
    }

    RateLookup lookup;
    auto it = rates.find(year);
    if (it != rates.end()) {
        lookup.rate = it->second;
        lookup.source_year = year;
        lookup.carried_forward = false;
        lookup.citation = Citation{source_label, table_key + ":year=" + std::to_string(year)};
        return lookup;
    }

    if (year > last_year) {
        lookup.rate = rates.rbegin()->second;
        lookup.source_year = last_year;
        lookup.carried_forward = true;
        lookup.citation = Citation{source_label, table_key + ":year=" + std::to_string(last_year) +
                                                     " (carried forward)"};
        return lookup;
    }

    // Gap inside the covered range is missing data, not something to guess
    throw TableLookupError(to_string(stage), table_key + ":year=" + std::to_string(year),
                           "year missing inside table coverage");
}

std::ifstream open_table(const std::string& filepath, const std::string& what) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open " + what + " file: " + filepath);
    }
    return file;
}

} // anonymous namespace

bool Citation::operator==(const Citation& other) const {
    return source_label == other.source_label && locator == other.locator;
}

// ============================================================================
// LifeTable Implementation
// ============================================================================

LifeTable::LifeTable() : LifeTable("") {}

LifeTable::LifeTable(const std::string& source_label) : source_label_(source_label) {
    for (auto& sex_rows : ex_) {
        sex_rows.fill(MISSING);
    }
}

void LifeTable::set_ex(unsigned age, Sex sex, double ex) {
    if (age > MAX_SUPPORTED_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " exceeds maximum age " +
                                std::to_string(MAX_SUPPORTED_AGE));
    }
    if (!std::isfinite(ex) || ex < 0.0) {
        throw std::invalid_argument("Life expectancy must be a non-negative number");
    }
    ex_[static_cast<size_t>(sex)][age] = ex;
}

bool LifeTable::has_row(unsigned age, Sex sex) const {
    return age <= MAX_SUPPORTED_AGE && !std::isnan(ex_[static_cast<size_t>(sex)][age]);
}

TableValue LifeTable::get_ex(unsigned age, Sex sex) const {
    std::string locator = "life_table:age=" + std::to_string(age) + ":" + to_string(sex);
    if (!has_row(age, sex)) {
        throw TableLookupError(to_string(Stage::LifeExpectancy), locator, "no life table row");
    }
    return TableValue{ex_[static_cast<size_t>(sex)][age], Citation{source_label_, locator}};
}

unsigned LifeTable::max_age() const {
    unsigned age = 0;
    while (age <= MAX_SUPPORTED_AGE && has_row(age, Sex::Male) && has_row(age, Sex::Female)) {
        ++age;
    }
    if (age == 0) {
        throw TableLookupError(to_string(Stage::LifeExpectancy), "life_table:age=0",
                               "life table is empty");
    }
    return age - 1;
}

LifeTable LifeTable::load_from_csv(const std::string& filepath, const std::string& source_label) {
    std::ifstream file = open_table(filepath, "life table");
    return load_from_csv(file, source_label);
}

LifeTable LifeTable::load_from_csv(std::istream& is, const std::string& source_label) {
    LifeTable table(source_label);
    CsvReader reader(is, "life_table");

    auto header = reader.read_header({"age", "male_ex", "female_ex"});
    size_t age_col = column_index(header, "age");
    size_t male_col = column_index(header, "male_ex");
    size_t female_col = column_index(header, "female_ex");

    unsigned expected_age = 0;
    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        if (row.size() < header.size()) {
            throw ConfigParseError("life_table:" + std::to_string(reader.line_number()) +
                                   ": expected columns age,male_ex,female_ex");
        }

        long age = reader.parse_int(row[age_col], "age");
        if (age != static_cast<long>(expected_age)) {
            throw ConfigParseError("life_table:" + std::to_string(reader.line_number()) +
                                   ": ages must be contiguous from 0, expected " +
                                   std::to_string(expected_age));
        }
        if (age > static_cast<long>(MAX_SUPPORTED_AGE)) {
            throw ConfigParseError("life_table: age " + std::to_string(age) + " exceeds " +
                                   std::to_string(MAX_SUPPORTED_AGE));
        }

        try {
            table.set_ex(static_cast<unsigned>(age), Sex::Male, reader.parse_double(row[male_col], "male_ex"));
            table.set_ex(static_cast<unsigned>(age), Sex::Female, reader.parse_double(row[female_col], "female_ex"));
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError("life_table:" + std::to_string(reader.line_number()) + ": " + e.what());
        }
        ++expected_age;
    }

    if (expected_age == 0) {
        throw ConfigParseError("life_table: no data rows");
    }
    return table;
}

// ============================================================================
// WorkLifeTable Implementation
// ============================================================================

WorkLifeTable::WorkLifeTable() {}

WorkLifeTable::WorkLifeTable(const std::string& name, const std::string& source_label)
    : name_(name), source_label_(source_label) {}

void WorkLifeTable::add_row(const WorkLifeRow& row) {
    if (row.age_min > row.age_max) {
        throw std::invalid_argument("Work-life bracket " + std::to_string(row.age_min) + "-" +
                                    std::to_string(row.age_max) + " is inverted");
    }
    if (!std::isfinite(row.factor) || row.factor < 0.0 || row.factor > 1.0) {
        throw std::invalid_argument("Work-life factor must be between 0.0 and 1.0");
    }
    for (const auto& existing : rows_) {
        bool same_cell = existing.sex == row.sex && existing.education == row.education;
        bool overlaps = row.age_min <= existing.age_max && existing.age_min <= row.age_max;
        if (same_cell && overlaps) {
            throw std::invalid_argument("Work-life bracket " + locator(row) + " overlaps " +
                                        locator(existing));
        }
    }
    rows_.push_back(row);
}

const WorkLifeRow& WorkLifeTable::find_row(unsigned age, Sex sex, EducationLevel education) const {
    for (const auto& row : rows_) {
        if (row.sex == sex && row.education == education &&
            age >= row.age_min && age <= row.age_max) {
            return row;
        }
    }
    throw TableLookupError(to_string(Stage::WorkLife),
                           "worklife:" + name_ + ":age=" + std::to_string(age) + ":" +
                           to_string(sex) + ":" + to_string(education),
                           "no work-life bracket");
}

TableValue WorkLifeTable::get_factor(unsigned age, Sex sex, EducationLevel education) const {
    const WorkLifeRow& row = find_row(age, sex, education);
    return TableValue{row.factor, Citation{source_label_, locator(row)}};
}

std::string WorkLifeTable::locator(const WorkLifeRow& row) const {
    return "worklife:" + name_ + ":age=" + std::to_string(row.age_min) + "-" +
           std::to_string(row.age_max) + ":" + to_string(row.sex) + ":" + to_string(row.education);
}

WorkLifeTable WorkLifeTable::load_from_csv(const std::string& filepath, const std::string& name,
                                           const std::string& source_label) {
    std::ifstream file = open_table(filepath, "work-life table");
    return load_from_csv(file, name, source_label);
}

WorkLifeTable WorkLifeTable::load_from_csv(std::istream& is, const std::string& name,
                                           const std::string& source_label) {
    WorkLifeTable table(name, source_label);
    CsvReader reader(is, "worklife:" + name);

    auto header = reader.read_header({"age_min", "age_max", "sex", "education", "factor"});
    size_t min_col = column_index(header, "age_min");
    size_t max_col = column_index(header, "age_max");
    size_t sex_col = column_index(header, "sex");
    size_t edu_col = column_index(header, "education");
    size_t factor_col = column_index(header, "factor");

    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        if (row.size() < header.size()) {
            throw ConfigParseError("worklife:" + name + ":" + std::to_string(reader.line_number()) +
                                   ": expected columns age_min,age_max,sex,education,factor");
        }

        long age_min = reader.parse_int(row[min_col], "age_min");
        long age_max = reader.parse_int(row[max_col], "age_max");
        if (age_min < 0 || age_max < 0) {
            throw ConfigParseError("worklife:" + name + ":" + std::to_string(reader.line_number()) +
                                   ": ages cannot be negative");
        }

        WorkLifeRow entry;
        entry.age_min = static_cast<unsigned>(age_min);
        entry.age_max = static_cast<unsigned>(age_max);
        entry.factor = reader.parse_double(row[factor_col], "factor");
        try {
            entry.sex = parse_sex(row[sex_col]);
            entry.education = parse_education(row[edu_col]);
            table.add_row(entry);
        } catch (const std::exception& e) {
            throw ConfigParseError("worklife:" + name + ":" + std::to_string(reader.line_number()) +
                                   ": " + e.what());
        }
    }

    return table;
}

// ============================================================================
// WageGrowthTable Implementation
// ============================================================================

WageGrowthTable::WageGrowthTable() {}

WageGrowthTable::WageGrowthTable(const std::string& source_label) : source_label_(source_label) {}

void WageGrowthTable::set_rate(int year, const std::string& category, double rate) {
    // Negative growth only ever comes from an explicit case override
    if (!std::isfinite(rate) || rate < 0.0) {
        throw std::invalid_argument("Wage growth table rate must be non-negative");
    }
    rates_[category][year] = rate;
}

RateLookup WageGrowthTable::get_rate(int year, const std::string& category) const {
    auto it = rates_.find(category);
    if (it == rates_.end()) {
        throw TableLookupError(to_string(Stage::WageGrowth), "wage_growth:" + category,
                               "unknown wage growth category");
    }
    return lookup_year(it->second, year, source_label_, "wage_growth:" + category, Stage::WageGrowth);
}

bool WageGrowthTable::has_category(const std::string& category) const {
    return rates_.count(category) > 0;
}

int WageGrowthTable::first_year(const std::string& category) const {
    auto it = rates_.find(category);
    if (it == rates_.end() || it->second.empty()) {
        throw TableLookupError(to_string(Stage::WageGrowth), "wage_growth:" + category,
                               "unknown wage growth category");
    }
    return it->second.begin()->first;
}

std::vector<std::string> WageGrowthTable::categories() const {
    std::vector<std::string> names;
    names.reserve(rates_.size());
    for (const auto& [category, years] : rates_) {
        names.push_back(category);
    }
    return names;
}

WageGrowthTable WageGrowthTable::load_from_csv(const std::string& filepath, const std::string& source_label) {
    std::ifstream file = open_table(filepath, "wage growth");
    return load_from_csv(file, source_label);
}

WageGrowthTable WageGrowthTable::load_from_csv(std::istream& is, const std::string& source_label) {
    WageGrowthTable table(source_label);
    CsvReader reader(is, "wage_growth");

    auto header = reader.read_header({"year", "category", "rate"});
    size_t year_col = column_index(header, "year");
    size_t category_col = column_index(header, "category");
    size_t rate_col = column_index(header, "rate");

    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        if (row.size() < header.size()) {
            throw ConfigParseError("wage_growth:" + std::to_string(reader.line_number()) +
                                   ": expected columns year,category,rate");
        }
        int year = static_cast<int>(reader.parse_int(row[year_col], "year"));
        double rate = reader.parse_double(row[rate_col], "rate");
        try {
            table.set_rate(year, row[category_col], rate);
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError("wage_growth:" + std::to_string(reader.line_number()) + ": " + e.what());
        }
    }

    return table;
}

// ============================================================================
// DiscountRateSeries Implementation
// ============================================================================

DiscountRateSeries::DiscountRateSeries() {}

DiscountRateSeries::DiscountRateSeries(const std::string& name, const std::string& source_label)
    : name_(name), source_label_(source_label) {}

void DiscountRateSeries::set_rate(int year, double rate) {
    if (!std::isfinite(rate) || rate <= -1.0) {
        throw std::invalid_argument("Discount rate " + format_rate(rate) + " must be greater than -1.0");
    }
    rates_[year] = rate;
}

RateLookup DiscountRateSeries::get_rate(int year) const {
    return lookup_year(rates_, year, source_label_, "discount:" + name_, Stage::Discounting);
}

DiscountRateSeries DiscountRateSeries::load_from_csv(const std::string& filepath, const std::string& name,
                                                     const std::string& source_label) {
    std::ifstream file = open_table(filepath, "discount series");
    return load_from_csv(file, name, source_label);
}

DiscountRateSeries DiscountRateSeries::load_from_csv(std::istream& is, const std::string& name,
                                                     const std::string& source_label) {
    DiscountRateSeries series(name, source_label);
    CsvReader reader(is, "discount:" + name);

    auto header = reader.read_header({"year", "rate"});
    size_t year_col = column_index(header, "year");
    size_t rate_col = column_index(header, "rate");

    for (auto row = reader.read_row(); !row.empty(); row = reader.read_row()) {
        if (row.size() < header.size()) {
            throw ConfigParseError("discount:" + name + ":" + std::to_string(reader.line_number()) +
                                   ": expected columns year,rate");
        }
        int year = static_cast<int>(reader.parse_int(row[year_col], "year"));
        double rate = reader.parse_double(row[rate_col], "rate");
        try {
            series.set_rate(year, rate);
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError("discount:" + name + ":" + std::to_string(reader.line_number()) +
                                   ": " + e.what());
        }
    }

    return series;
}

// ============================================================================
// ReferenceTables Implementation
// ============================================================================

ReferenceTables::ReferenceTables(LifeTable life_table,
                                 std::map<std::string, WorkLifeTable> worklife_tables,
                                 WageGrowthTable wage_growth,
                                 std::map<std::string, DiscountRateSeries> discount_series)
    : life_table_(std::move(life_table))
    , worklife_tables_(std::move(worklife_tables))
    , wage_growth_(std::move(wage_growth))
    , discount_series_(std::move(discount_series)) {}

const WorkLifeTable& ReferenceTables::worklife_table(const std::string& name) const {
    auto it = worklife_tables_.find(name);
    if (it == worklife_tables_.end()) {
        throw TableLookupError(to_string(Stage::WorkLife), "worklife:" + name,
                               "unknown work-life table");
    }
    return it->second;
}

const DiscountRateSeries& ReferenceTables::discount_series(const std::string& name) const {
    auto it = discount_series_.find(name);
    if (it == discount_series_.end()) {
        throw TableLookupError(to_string(Stage::Discounting), "discount:" + name,
                               "unknown discount series");
    }
    return it->second;
}

std::vector<std::string> ReferenceTables::worklife_table_names() const {
    std::vector<std::string> names;
    for (const auto& [name, table] : worklife_tables_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> ReferenceTables::discount_series_names() const {
    std::vector<std::string> names;
    for (const auto& [name, series] : discount_series_) {
        names.push_back(name);
    }
    return names;
}

} // namespace losscalc
