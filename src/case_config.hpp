#ifndef LOSSCALC_CASE_CONFIG_HPP
#define LOSSCALC_CASE_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace losscalc {

enum class Sex : uint8_t {
    Male = 0,
    Female = 1
};

enum class EducationLevel : uint8_t {
    HighSchool = 0,
    SomeCollege = 1,
    Bachelors = 2,
    Masters = 3,
    Doctorate = 4,
    Other = 5
};

enum class ActiveStatus : uint8_t {
    Active = 0,
    Inactive = 1
};

// Parse/format helpers use the spellings found in case files
// ("male", "BA", "inactive", ...). Parsing throws InvalidConfigError.
Sex parse_sex(const std::string& value);
EducationLevel parse_education(const std::string& value);
ActiveStatus parse_active_status(const std::string& value);

std::string to_string(Sex sex);
std::string to_string(EducationLevel education);
std::string to_string(ActiveStatus status);

// Calendar date (proleptic Gregorian), no time-of-day component
struct Date {
    int year;
    unsigned month;
    unsigned day;

    Date();
    Date(int y, unsigned m, unsigned d);

    // Parse "YYYY-MM-DD"; throws InvalidConfigError on malformed or impossible dates
    static Date parse(const std::string& iso);

    std::string to_iso() const;

    // Days since 1970-01-01
    int64_t days_since_epoch() const;

    bool operator==(const Date& other) const;
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const;
};

// Age in fractional years: elapsed days / 365.25
double age_in_years(const Date& birth, const Date& evaluation);

struct Person {
    std::string first_name;
    std::string last_name;
    Date date_of_birth;
    Date evaluation_date;           // Date of death or valuation date
    Sex sex;
    EducationLevel education;
    ActiveStatus active_status;

    Person();
};

struct Occupation {
    std::string soc_code;           // e.g. "11-2022"
    std::string title;
    std::string county;
    std::string state;
    double base_salary;             // Annual, USD

    Occupation();

    // First two digits of the SOC code ("11" for "11-2022")
    std::string soc_major_group() const;
};

// Optional overrides; an empty optional means "use the reference tables"
struct Assumptions {
    std::optional<double> retirement_age_hint;
    std::optional<double> life_expectancy_years;
    std::optional<double> worklife_years;
    std::optional<std::string> worklife_table;
    std::optional<double> discount_rate;
    std::optional<std::string> discount_series;
    std::optional<double> wage_growth_rate;
    std::optional<std::string> wage_growth_category;
};

struct CaseConfig {
    std::string case_id;
    Person person;
    Occupation occupation;
    Assumptions assumptions;

    // Throws InvalidConfigError naming the offending field
    void validate() const;

    double age_at_evaluation() const;
};

// ============================================================================
// Source choices
// ============================================================================
//
// Each stage resolves "override or table" once, up front, into one of
// these alternatives instead of checking optionals inside the computation.

constexpr const char* DEFAULT_WORKLIFE_TABLE = "default";
constexpr const char* RETIREMENT_AGE_METHOD = "retirement-age";
constexpr const char* DEFAULT_DISCOUNT_SERIES = "treasury_1y";
constexpr double DEFAULT_RETIREMENT_AGE = 65.0;

struct UserOverride {
    double value;
    std::string field;              // Config field that supplied the value
};

struct TableLookup {
    std::string key;                // Table name, series name or category
};

struct InactiveStatus {};

struct RetirementAgeHint {
    double retirement_age;
    bool defaulted;                 // True if the case did not supply a hint
};

using LifeExpectancySource = std::variant<UserOverride, TableLookup>;
using WorkLifeSource = std::variant<InactiveStatus, UserOverride, RetirementAgeHint, TableLookup>;
using RateSource = std::variant<UserOverride, TableLookup>;

LifeExpectancySource life_expectancy_source(const CaseConfig& config);
WorkLifeSource worklife_source(const CaseConfig& config);
RateSource wage_growth_source(const CaseConfig& config);
RateSource discount_source(const CaseConfig& config);

} // namespace losscalc

#endif // LOSSCALC_CASE_CONFIG_HPP
