#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace losscalc {
namespace io {

namespace {

// Decimal places per kind of value
const int MONEY_PRECISION = 2;
const int YEARS_PRECISION = 6;
const int RATE_PRECISION = 6;
const int PERCENT_PRECISION = 4;
const int FACTOR_PRECISION = 10;

// Tracks indentation and separators for hand-streamed JSON
class JsonStream {
public:
    JsonStream(std::ostream& os, bool pretty)
        : os_(os), pretty_(pretty), depth_(0), first_(true) {}

    void begin_object() { open('{'); }
    void end_object() { close('}'); }
    void begin_array() { open('['); }
    void end_array() { close(']'); }

    JsonStream& key(const std::string& name) {
        separator();
        os_ << '"' << escape_json(name) << "\":" << (pretty_ ? " " : "");
        pending_value_ = true;
        return *this;
    }

    void string(const std::string& value) {
        element();
        os_ << '"' << escape_json(value) << '"';
    }

    void number(double value, int precision) {
        element();
        os_ << std::fixed << std::setprecision(precision) << value;
    }

    void integer(long long value) {
        element();
        os_ << value;
    }

    void boolean(bool value) {
        element();
        os_ << (value ? "true" : "false");
    }

    void null() {
        element();
        os_ << "null";
    }

    void optional_number(const std::optional<double>& value, int precision, double scale = 1.0) {
        if (value) {
            number(*value * scale, precision);
        } else {
            null();
        }
    }

    void finish() {
        if (pretty_) {
            os_ << '\n';
        }
    }

private:
    std::ostream& os_;
    bool pretty_;
    int depth_;
    bool first_;
    bool pending_value_ = false;

    void newline() {
        if (pretty_) {
            os_ << '\n' << std::string(static_cast<size_t>(depth_) * 2, ' ');
        }
    }

    // Comma and indentation before a key or an array element
    void separator() {
        if (!first_) {
            os_ << ',';
        }
        first_ = false;
        if (depth_ > 0) {
            newline();
        }
    }

    void element() {
        if (pending_value_) {
            pending_value_ = false;
        } else {
            separator();
        }
    }

    void open(char bracket) {
        element();
        os_ << bracket;
        ++depth_;
        first_ = true;
    }

    void close(char bracket) {
        --depth_;
        if (!first_) {
            newline();
        }
        os_ << bracket;
        first_ = false;
    }
};

void write_citation(JsonStream& js, const Citation& citation) {
    js.key("source").string(citation.source_label);
    js.key("locator").string(citation.locator);
}

void write_summary(JsonStream& js, const CaseResult& result) {
    js.key("summary").begin_object();
    js.key("age_years").number(result.age, YEARS_PRECISION);
    js.key("life_expectancy_years").number(result.life_expectancy_years(), YEARS_PRECISION);
    js.key("worklife_remaining_years").number(result.worklife_years(), YEARS_PRECISION);
    js.key("avg_wage_growth_pct").optional_number(result.average_growth_rate, PERCENT_PRECISION, 100.0);
    js.key("discount_rate_pct").optional_number(result.discount_rate, PERCENT_PRECISION, 100.0);
    js.key("undiscounted_earnings_usd").number(result.undiscounted_total(), MONEY_PRECISION);
    js.key("total_economic_loss_usd").number(result.total_economic_loss(), MONEY_PRECISION);
    js.end_object();
}

void write_dashboard(JsonStream& js, const CaseConfig& config) {
    js.key("dashboard").begin_object();
    js.key("first_name").string(config.person.first_name);
    js.key("last_name").string(config.person.last_name);
    js.key("sex").string(to_string(config.person.sex));
    js.key("dob").string(config.person.date_of_birth.to_iso());
    js.key("dod").string(config.person.evaluation_date.to_iso());
    js.key("education_level").string(to_string(config.person.education));
    js.key("active_status").string(to_string(config.person.active_status));
    js.key("soc_code").string(config.occupation.soc_code);
    js.key("title").string(config.occupation.title);
    js.key("county").string(config.occupation.county);
    js.key("state").string(config.occupation.state);
    js.key("base_salary_usd").number(config.occupation.base_salary, MONEY_PRECISION);
    js.end_object();
}

void write_life_expectancy(JsonStream& js, const LifeExpectancyResult& life) {
    js.key("life_expectancy").begin_object();
    js.key("age").number(life.age, YEARS_PRECISION);
    js.key("remaining_years").number(life.remaining_years, YEARS_PRECISION);
    js.key("from_override").boolean(life.from_override);
    js.key("rows").begin_array();
    for (const auto& row : life.rows) {
        js.begin_object();
        js.key("age").integer(row.age);
        js.key("ex").number(row.ex, YEARS_PRECISION);
        js.key("weight").number(row.weight, YEARS_PRECISION);
        write_citation(js, row.citation);
        js.end_object();
    }
    js.end_array();
    js.key("timeline").begin_array();
    for (double fraction : life.timeline) {
        js.number(fraction, YEARS_PRECISION);
    }
    js.end_array();
    js.end_object();
}

void write_worklife(JsonStream& js, const WorkLifeResult& worklife) {
    js.key("worklife").begin_object();
    js.key("method").string(to_string(worklife.method));
    js.key("years").number(worklife.years, YEARS_PRECISION);
    js.key("unclamped_years").number(worklife.unclamped_years, YEARS_PRECISION);
    js.key("clamped").boolean(worklife.clamped);
    if (worklife.method == WorkLifeMethod::TableFactor) {
        js.key("table").string(worklife.table_name);
        js.key("factor").number(worklife.factor, RATE_PRECISION);
        js.key("age_min").integer(worklife.bracket_min_age);
        js.key("age_max").integer(worklife.bracket_max_age);
    }
    js.end_object();
}

void write_wage_growth(JsonStream& js, const GrowthSchedule& schedule) {
    js.key("wage_growth").begin_array();
    for (const auto& entry : schedule.entries) {
        js.begin_object();
        js.key("year_index").integer(entry.year_index);
        js.key("calendar_year").integer(entry.calendar_year);
        js.key("rate").number(entry.rate, RATE_PRECISION);
        js.key("carried_forward").boolean(entry.carried_forward);
        js.end_object();
    }
    js.end_array();
}

void write_wage_history(JsonStream& js, const WageHistory& history) {
    js.key("wage_history").begin_object();
    js.key("entries").begin_array();
    for (const auto& entry : history.entries) {
        js.begin_object();
        js.key("year_index").integer(entry.year_index);
        js.key("calendar_year").integer(entry.calendar_year);
        js.key("mean_wage").number(entry.mean_wage, MONEY_PRECISION);
        js.key("yoy_growth").optional_number(entry.yoy_growth, RATE_PRECISION);
        js.end_object();
    }
    js.end_array();
    js.key("average_growth").optional_number(history.average_growth(), RATE_PRECISION);
    js.end_object();
}

void write_projections(JsonStream& js, const EarningsSchedule& schedule) {
    js.key("projections").begin_array();
    for (const auto& entry : schedule.entries) {
        js.begin_object();
        js.key("year_index").integer(entry.year_index);
        js.key("calendar_year").integer(entry.calendar_year);
        js.key("year_fraction").number(entry.year_fraction, YEARS_PRECISION);
        js.key("full_year_earnings").number(entry.full_year_earnings, MONEY_PRECISION);
        js.key("nominal_earnings").number(entry.nominal_earnings, MONEY_PRECISION);
        js.end_object();
    }
    js.end_array();
}

void write_discount_factors(JsonStream& js, const DiscountFactorSchedule& schedule) {
    js.key("discount_factors").begin_array();
    for (const auto& entry : schedule.entries) {
        js.begin_object();
        js.key("year_index").integer(entry.year_index);
        js.key("calendar_year").integer(entry.calendar_year);
        js.key("rate").number(entry.rate, RATE_PRECISION);
        js.key("discount_factor").number(entry.discount_factor, FACTOR_PRECISION);
        js.end_object();
    }
    js.end_array();
}

void write_present_value(JsonStream& js, const PresentValueResult& pv) {
    js.key("present_value").begin_object();
    js.key("entries").begin_array();
    for (const auto& entry : pv.entries) {
        js.begin_object();
        js.key("year_index").integer(entry.year_index);
        js.key("calendar_year").integer(entry.calendar_year);
        js.key("nominal_earnings").number(entry.nominal_earnings, MONEY_PRECISION);
        js.key("discount_factor").number(entry.discount_factor, FACTOR_PRECISION);
        js.key("present_value").number(entry.present_value, MONEY_PRECISION);
        js.key("cumulative_pv").number(entry.cumulative_present_value, MONEY_PRECISION);
        js.end_object();
    }
    js.end_array();
    js.key("total").number(pv.total, MONEY_PRECISION);
    js.end_object();
}

void write_audit_log(JsonStream& js, const std::vector<AuditEntry>& entries) {
    js.key("audit_log").begin_array();
    for (const auto& entry : entries) {
        js.begin_object();
        js.key("stage").string(to_string(entry.stage));
        js.key("description").string(entry.description);
        js.key("value").number(entry.value, FACTOR_PRECISION);
        js.key("source").string(entry.source_label);
        js.key("locator").string(entry.source_locator);
        js.end_object();
    }
    js.end_array();
}

void write_result(JsonStream& js, const CaseResult& result) {
    js.begin_object();
    js.key("case_id").string(result.config.case_id);
    write_summary(js, result);
    write_dashboard(js, result.config);
    write_life_expectancy(js, result.life_expectancy);
    write_worklife(js, result.worklife);
    write_wage_growth(js, result.wage_growth);
    write_wage_history(js, result.wage_history);
    write_projections(js, result.earnings);
    write_discount_factors(js, result.discount_factors);
    write_present_value(js, result.present_value);
    write_audit_log(js, result.audit_entries);
    js.end_object();
}

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

std::string escape_json(const std::string& value) {
    std::ostringstream oss;
    for (char c : value) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void write_case_result_json(std::ostream& os, const CaseResult& result, bool pretty_print) {
    JsonStream js(os, pretty_print);
    write_result(js, result);
    js.finish();
}

void write_case_result_json(const std::string& filepath, const CaseResult& result,
                            bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_case_result_json(file, result, pretty_print);
}

void write_batch_json(std::ostream& os, const std::vector<CaseOutcome>& outcomes,
                      bool pretty_print) {
    JsonStream js(os, pretty_print);
    js.begin_object();

    js.key("results").begin_array();
    for (const auto& outcome : outcomes) {
        if (outcome.success && outcome.result) {
            write_result(js, *outcome.result);
        }
    }
    js.end_array();

    js.key("failures").begin_array();
    for (const auto& outcome : outcomes) {
        if (!outcome.success) {
            js.begin_object();
            js.key("case_id").string(outcome.case_id);
            js.key("error").string(outcome.error_message);
            js.key("stage").string(outcome.error_stage);
            js.key("key").string(outcome.error_key);
            js.end_object();
        }
    }
    js.end_array();

    js.end_object();
    js.finish();
}

void write_batch_json(const std::string& filepath, const std::vector<CaseOutcome>& outcomes,
                      bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_batch_json(file, outcomes, pretty_print);
}

} // namespace io
} // namespace losscalc
