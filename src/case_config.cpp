#include "case_config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace losscalc {

namespace {

const char* const CONFIG_STAGE = "config";

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

void require_finite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        throw InvalidConfigError(CONFIG_STAGE, field, "value must be finite");
    }
}

} // anonymous namespace

// ============================================================================
// Enum parsing
// ============================================================================

Sex parse_sex(const std::string& value) {
    std::string v = lowercase(value);
    if (v == "male" || v == "m") return Sex::Male;
    if (v == "female" || v == "f") return Sex::Female;
    throw InvalidConfigError(CONFIG_STAGE, "person.sex", "unknown sex '" + value + "'");
}

EducationLevel parse_education(const std::string& value) {
    std::string v = lowercase(value);
    if (v == "hs") return EducationLevel::HighSchool;
    if (v == "somecollege") return EducationLevel::SomeCollege;
    if (v == "ba") return EducationLevel::Bachelors;
    if (v == "ma") return EducationLevel::Masters;
    if (v == "phd") return EducationLevel::Doctorate;
    if (v == "other") return EducationLevel::Other;
    throw InvalidConfigError(CONFIG_STAGE, "person.education_level",
                             "unknown education level '" + value + "'");
}

ActiveStatus parse_active_status(const std::string& value) {
    std::string v = lowercase(value);
    if (v == "active") return ActiveStatus::Active;
    if (v == "inactive") return ActiveStatus::Inactive;
    throw InvalidConfigError(CONFIG_STAGE, "person.active_status",
                             "unknown active status '" + value + "'");
}

std::string to_string(Sex sex) {
    return sex == Sex::Male ? "male" : "female";
}

std::string to_string(EducationLevel education) {
    switch (education) {
        case EducationLevel::HighSchool: return "HS";
        case EducationLevel::SomeCollege: return "SomeCollege";
        case EducationLevel::Bachelors: return "BA";
        case EducationLevel::Masters: return "MA";
        case EducationLevel::Doctorate: return "PhD";
        case EducationLevel::Other: return "Other";
    }
    return "Other";
}

std::string to_string(ActiveStatus status) {
    return status == ActiveStatus::Active ? "active" : "inactive";
}

// ============================================================================
// Date Implementation
// ============================================================================

Date::Date() : year(1970), month(1), day(1) {}

Date::Date(int y, unsigned m, unsigned d) : year(y), month(m), day(d) {}

Date Date::parse(const std::string& iso) {
    bool well_formed = iso.size() == 10 && iso[4] == '-' && iso[7] == '-';
    for (size_t i = 0; well_formed && i < iso.size(); ++i) {
        if (i == 4 || i == 7) continue;
        well_formed = std::isdigit(static_cast<unsigned char>(iso[i])) != 0;
    }
    if (!well_formed) {
        throw InvalidConfigError(CONFIG_STAGE, iso, "date must be formatted YYYY-MM-DD");
    }

    int y = std::stoi(iso.substr(0, 4));
    unsigned m = static_cast<unsigned>(std::stoi(iso.substr(5, 2)));
    unsigned d = static_cast<unsigned>(std::stoi(iso.substr(8, 2)));

    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        throw InvalidConfigError(CONFIG_STAGE, iso, "date does not exist");
    }
    return Date(y, m, d);
}

std::string Date::to_iso() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-' << std::setw(2) << day;
    return oss.str();
}

int64_t Date::days_since_epoch() const {
    // Civil-from-days inverse (H. Hinnant), valid for the whole Gregorian range
    int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = month > 2 ? month - 3 : month + 9;
    int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(day) - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator<(const Date& other) const {
    return days_since_epoch() < other.days_since_epoch();
}

bool Date::operator<=(const Date& other) const {
    return !(other < *this);
}

double age_in_years(const Date& birth, const Date& evaluation) {
    int64_t days = evaluation.days_since_epoch() - birth.days_since_epoch();
    return static_cast<double>(days) / 365.25;
}

// ============================================================================
// Person / Occupation
// ============================================================================

Person::Person()
    : sex(Sex::Male)
    , education(EducationLevel::Other)
    , active_status(ActiveStatus::Active) {}

Occupation::Occupation() : base_salary(0.0) {}

std::string Occupation::soc_major_group() const {
    if (soc_code.size() < 2 ||
        !std::isdigit(static_cast<unsigned char>(soc_code[0])) ||
        !std::isdigit(static_cast<unsigned char>(soc_code[1]))) {
        throw InvalidConfigError(CONFIG_STAGE, "occupation.soc_code",
                                 "SOC code '" + soc_code + "' has no major group");
    }
    return soc_code.substr(0, 2);
}

// ============================================================================
// CaseConfig Implementation
// ============================================================================

void CaseConfig::validate() const {
    if (!(person.date_of_birth <= person.evaluation_date)) {
        throw InvalidConfigError(CONFIG_STAGE, "person.dob",
                                 "date of birth " + person.date_of_birth.to_iso() +
                                 " is after evaluation date " + person.evaluation_date.to_iso());
    }

    require_finite(occupation.base_salary, "occupation.base_salary_usd");
    if (occupation.base_salary <= 0.0) {
        throw InvalidConfigError(CONFIG_STAGE, "occupation.base_salary_usd",
                                 "base salary must be positive");
    }

    const Assumptions& a = assumptions;
    if (a.retirement_age_hint) {
        require_finite(*a.retirement_age_hint, "assumptions.retirement_age_hint");
        if (*a.retirement_age_hint < 0.0) {
            throw InvalidConfigError(CONFIG_STAGE, "assumptions.retirement_age_hint",
                                     "retirement age cannot be negative");
        }
    }
    if (a.life_expectancy_years) {
        require_finite(*a.life_expectancy_years, "assumptions.life_expectancy_override_years");
        if (*a.life_expectancy_years < 0.0) {
            throw InvalidConfigError(CONFIG_STAGE, "assumptions.life_expectancy_override_years",
                                     "life expectancy override cannot be negative");
        }
    }
    if (a.worklife_years) {
        require_finite(*a.worklife_years, "assumptions.worklife_table_override");
        if (*a.worklife_years < 0.0) {
            throw InvalidConfigError(CONFIG_STAGE, "assumptions.worklife_table_override",
                                     "work-life override cannot be negative");
        }
    }
    if (a.discount_rate) {
        require_finite(*a.discount_rate, "assumptions.discount_rate_override");
        if (*a.discount_rate <= -1.0) {
            throw InvalidConfigError(CONFIG_STAGE, "assumptions.discount_rate_override",
                                     "discount rate must be greater than -100%");
        }
    }
    if (a.wage_growth_rate) {
        require_finite(*a.wage_growth_rate, "assumptions.annual_growth_rate_override");
        if (*a.wage_growth_rate <= -1.0) {
            throw InvalidConfigError(CONFIG_STAGE, "assumptions.annual_growth_rate_override",
                                     "growth rate must be greater than -100%");
        }
    }

    // The wage growth table is keyed by SOC major group unless told otherwise
    if (!a.wage_growth_rate && !a.wage_growth_category) {
        occupation.soc_major_group();
    }
}

double CaseConfig::age_at_evaluation() const {
    return age_in_years(person.date_of_birth, person.evaluation_date);
}

// ============================================================================
// Source choices
// ============================================================================

LifeExpectancySource life_expectancy_source(const CaseConfig& config) {
    if (config.assumptions.life_expectancy_years) {
        return UserOverride{*config.assumptions.life_expectancy_years,
                            "assumptions.life_expectancy_override_years"};
    }
    return TableLookup{"life_table"};
}

WorkLifeSource worklife_source(const CaseConfig& config) {
    const Assumptions& a = config.assumptions;
    if (config.person.active_status == ActiveStatus::Inactive) {
        return InactiveStatus{};
    }
    if (a.worklife_years) {
        return UserOverride{*a.worklife_years, "assumptions.worklife_table_override"};
    }
    std::string table = a.worklife_table.value_or(DEFAULT_WORKLIFE_TABLE);
    if (table == RETIREMENT_AGE_METHOD) {
        return RetirementAgeHint{a.retirement_age_hint.value_or(DEFAULT_RETIREMENT_AGE),
                                 !a.retirement_age_hint.has_value()};
    }
    return TableLookup{table};
}

RateSource wage_growth_source(const CaseConfig& config) {
    const Assumptions& a = config.assumptions;
    if (a.wage_growth_rate) {
        return UserOverride{*a.wage_growth_rate, "assumptions.annual_growth_rate_override"};
    }
    if (a.wage_growth_category) {
        return TableLookup{*a.wage_growth_category};
    }
    return TableLookup{config.occupation.soc_major_group()};
}

RateSource discount_source(const CaseConfig& config) {
    const Assumptions& a = config.assumptions;
    if (a.discount_rate) {
        return UserOverride{*a.discount_rate, "assumptions.discount_rate_override"};
    }
    return TableLookup{a.discount_series.value_or(DEFAULT_DISCOUNT_SERIES)};
}

} // namespace losscalc
