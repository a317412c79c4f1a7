#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include "config_parser.hpp"
#include "io/json_writer.hpp"
#include "logger.hpp"
#include "table_provider.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace losscalc;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

const std::string DATA_DIR = LOSSCALC_DATA_DIR;

CaseRunner sample_runner() {
    LoggerConfig quiet;
    quiet.enable_console = false;
    Logger::get_instance().configure(quiet);

    CsvTableProvider provider(parse_table_sources_from_file(DATA_DIR + "/tables.json"));
    return CaseRunner(load_reference_tables(provider));
}

CaseConfig sample_case() {
    return parse_case_config_from_file(DATA_DIR + "/sample_case.json");
}

json to_json(const CaseResult& result, bool pretty) {
    std::ostringstream oss;
    io::write_case_result_json(oss, result, pretty);
    return json::parse(oss.str());
}

} // anonymous namespace

TEST_CASE("Case result JSON has every section", "[json_writer]") {
    CaseRunner runner = sample_runner();
    CaseResult result = runner.run(sample_case());

    json doc = to_json(result, true);

    REQUIRE(doc["case_id"] == "case_001");
    for (const char* key : {"summary", "dashboard", "life_expectancy", "worklife", "wage_growth",
                            "wage_history", "projections", "discount_factors", "present_value", "audit_log"}) {
        REQUIRE(doc.contains(key));
    }

    const json& summary = doc["summary"];
    REQUIRE_THAT(summary["total_economic_loss_usd"].get<double>(),
                 WithinAbs(result.total_economic_loss(), 0.005));
    REQUIRE_THAT(summary["undiscounted_earnings_usd"].get<double>(),
                 WithinAbs(result.undiscounted_total(), 0.005));
    REQUIRE_THAT(summary["discount_rate_pct"].get<double>(), WithinAbs(3.7, 1e-9));
    REQUIRE_THAT(summary["worklife_remaining_years"].get<double>(),
                 WithinAbs(result.worklife_years(), 1e-6));

    REQUIRE(doc["dashboard"]["first_name"] == "Jane");
    REQUIRE(doc["dashboard"]["education_level"] == "BA");
    REQUIRE(doc["worklife"]["method"] == "table_factor");
    REQUIRE(doc["worklife"]["table"] == "default");

    REQUIRE(doc["life_expectancy"]["timeline"].size() == result.life_expectancy.timeline.size());
    REQUIRE(doc["wage_history"]["entries"].size() == result.wage_history.size());
    REQUIRE(doc["wage_history"]["entries"][0]["yoy_growth"].is_null());
    REQUIRE(doc["wage_history"]["entries"].back()["mean_wage"].get<double>() == 86900.0);
    REQUIRE(doc["wage_history"]["average_growth"].is_number());

    REQUIRE(doc["projections"].size() == result.earnings.size());
    REQUIRE(doc["projections"][0]["nominal_earnings"].get<double>() == 86900.0);
    REQUIRE(doc["present_value"]["entries"].size() == result.present_value.entries.size());
    REQUIRE(doc["audit_log"].size() == result.audit_entries.size());

    const json& first_citation = doc["audit_log"][0];
    REQUIRE(first_citation["stage"] == "life_expectancy");
    REQUIRE(first_citation["locator"] == result.audit_entries[0].source_locator);
    REQUIRE(first_citation["source"] == result.audit_entries[0].source_label);
}

TEST_CASE("Compact and pretty output carry the same document", "[json_writer]") {
    CaseRunner runner = sample_runner();
    CaseResult result = runner.run(sample_case());

    std::ostringstream compact;
    io::write_case_result_json(compact, result, false);

    REQUIRE(compact.str().find('\n') == std::string::npos);
    REQUIRE(json::parse(compact.str()) == to_json(result, true));
}

TEST_CASE("Missing summary rates are written as null", "[json_writer]") {
    CaseRunner runner = sample_runner();
    CaseConfig config = sample_case();
    config.assumptions.life_expectancy_years = 0.0;

    json doc = to_json(runner.run(config), true);

    REQUIRE(doc["summary"]["avg_wage_growth_pct"].is_null());
    REQUIRE(doc["summary"]["discount_rate_pct"].is_null());
    REQUIRE(doc["projections"].empty());
    REQUIRE(doc["present_value"]["total"].get<double>() == 0.0);
    REQUIRE(doc["life_expectancy"]["from_override"] == true);
}

TEST_CASE("Batch JSON separates results from failures", "[json_writer][batch]") {
    CaseRunner runner = sample_runner();
    CaseConfig good = sample_case();
    CaseConfig bad = sample_case();
    bad.case_id = "case_bad";
    bad.assumptions.discount_series = "libor";

    std::ostringstream oss;
    io::write_batch_json(oss, runner.run_batch({good, bad}), true);
    json doc = json::parse(oss.str());

    REQUIRE(doc["results"].size() == 1);
    REQUIRE(doc["results"][0]["case_id"] == "case_001");
    REQUIRE(doc["failures"].size() == 1);
    REQUIRE(doc["failures"][0]["case_id"] == "case_bad");
    REQUIRE(doc["failures"][0]["stage"] == "discounting");
    REQUIRE(doc["failures"][0]["key"] == "discount:libor");
}

TEST_CASE("Writing to a file", "[json_writer]") {
    CaseRunner runner = sample_runner();
    CaseResult result = runner.run(sample_case());
    std::string path = (std::filesystem::temp_directory_path() / "losscalc_test_result.json").string();

    io::write_case_result_json(path, result);

    std::ifstream file(path);
    REQUIRE(file.good());
    json doc = json::parse(file);
    REQUIRE(doc["case_id"] == "case_001");
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(io::write_case_result_json("/nonexistent/dir/out.json", result),
                      std::runtime_error);
}

TEST_CASE("JSON string escaping", "[json_writer]") {
    REQUIRE(io::escape_json("plain") == "plain");
    REQUIRE(io::escape_json("a\"b") == "a\\\"b");
    REQUIRE(io::escape_json("back\\slash") == "back\\\\slash");
    REQUIRE(io::escape_json("tab\there\n") == "tab\\there\\n");
    REQUIRE(io::escape_json(std::string(1, '\x01')) == "\\u0001");
}
