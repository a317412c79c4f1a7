#include "config_parser.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace losscalc {

namespace {

std::string read_file(const std::string& file_path, const std::string& what) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open " + what + ": " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool has_value(const json& object, const char* key) {
    return object.contains(key) && !object[key].is_null();
}

const json& required_object(const json& parent, const char* key, const std::string& path) {
    if (!has_value(parent, key) || !parent[key].is_object()) {
        throw ConfigParseError("Missing required object: " + path);
    }
    return parent[key];
}

std::string required_string(const json& parent, const char* key, const std::string& path) {
    if (!has_value(parent, key)) {
        throw ConfigParseError("Missing required field: " + path);
    }
    return parent[key].get<std::string>();
}

std::string optional_string(const json& parent, const char* key) {
    return has_value(parent, key) ? parent[key].get<std::string>() : std::string();
}

std::optional<double> optional_number(const json& parent, const char* key) {
    if (!has_value(parent, key)) {
        return std::nullopt;
    }
    return parent[key].get<double>();
}

std::optional<std::string> optional_selector(const json& parent, const char* key) {
    if (!has_value(parent, key)) {
        return std::nullopt;
    }
    return parent[key].get<std::string>();
}

TableSource parse_source(const json& node, const std::string& path, const std::string& default_label) {
    if (!node.is_object()) {
        throw ConfigParseError("Table source must be an object: " + path);
    }
    TableSource source;
    source.path = expand_environment_variables(required_string(node, "source", path + ".source"));
    source.label = has_value(node, "label") ? node["label"].get<std::string>() : default_label;
    return source;
}

std::map<std::string, TableSource> parse_named_sources(const json& parent, const char* key) {
    std::map<std::string, TableSource> sources;
    if (!has_value(parent, key)) {
        return sources;
    }
    if (!parent[key].is_object()) {
        throw ConfigParseError(std::string("Expected an object of named tables: ") + key);
    }
    for (auto it = parent[key].begin(); it != parent[key].end(); ++it) {
        sources[it.key()] = parse_source(it.value(), std::string(key) + "." + it.key(), it.key());
    }
    return sources;
}

} // anonymous namespace

// ============================================================================
// Path helpers
// ============================================================================

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        if (name_end == name_start) {
            // Lone '$' is kept as written
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(strip_local_scheme(path));

    if (p.is_absolute()) {
        return p.string();
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

// ============================================================================
// Case configuration
// ============================================================================

CaseConfig parse_case_config_from_string(const std::string& json_string) {
    CaseConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Case configuration must be a JSON object");
        }

        config.case_id = required_string(j, "case_id", "case_id");

        const json& person = required_object(j, "person", "person");
        config.person.first_name = optional_string(person, "first_name");
        config.person.last_name = optional_string(person, "last_name");
        config.person.sex = parse_sex(required_string(person, "sex", "person.sex"));
        config.person.date_of_birth = Date::parse(required_string(person, "dob", "person.dob"));
        config.person.evaluation_date = Date::parse(required_string(person, "dod", "person.dod"));
        if (has_value(person, "education_level")) {
            config.person.education = parse_education(person["education_level"].get<std::string>());
        }
        if (has_value(person, "active_status")) {
            config.person.active_status = parse_active_status(person["active_status"].get<std::string>());
        }

        const json& occupation = required_object(j, "occupation", "occupation");
        config.occupation.soc_code = required_string(occupation, "soc_code", "occupation.soc_code");
        config.occupation.title = optional_string(occupation, "title");
        config.occupation.county = optional_string(occupation, "county");
        config.occupation.state = optional_string(occupation, "state");
        if (!has_value(occupation, "base_salary_usd")) {
            throw ConfigParseError("Missing required field: occupation.base_salary_usd");
        }
        config.occupation.base_salary = occupation["base_salary_usd"].get<double>();

        if (has_value(j, "assumptions")) {
            const json& a = j["assumptions"];
            Assumptions& out = config.assumptions;
            out.retirement_age_hint = optional_number(a, "retirement_age_hint");
            out.life_expectancy_years = optional_number(a, "life_expectancy_override_years");
            out.worklife_years = optional_number(a, "worklife_table_override");
            out.worklife_table = optional_selector(a, "worklife_table");
            out.discount_rate = optional_number(a, "discount_rate_override");
            out.discount_series = optional_selector(a, "discount_series");
            out.wage_growth_rate = optional_number(a, "annual_growth_rate_override");
            out.wage_growth_category = optional_selector(a, "wage_growth_category");
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

CaseConfig parse_case_config_from_file(const std::string& file_path) {
    return parse_case_config_from_string(read_file(file_path, "case file"));
}

// ============================================================================
// Table sources
// ============================================================================

TableSources parse_table_sources_from_string(const std::string& json_string) {
    TableSources sources;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Tables configuration must be a JSON object");
        }

        sources.life_table = parse_source(required_object(j, "life_table", "life_table"),
                                          "life_table", "life table");
        sources.worklife_tables = parse_named_sources(j, "worklife_tables");
        sources.wage_growth = parse_source(required_object(j, "wage_growth", "wage_growth"),
                                           "wage_growth", "wage growth");
        sources.discount_series = parse_named_sources(j, "discount_series");

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return sources;
}

TableSources parse_table_sources_from_file(const std::string& file_path) {
    TableSources sources = parse_table_sources_from_string(read_file(file_path, "tables config"));

    sources.life_table.path = resolve_relative_path(sources.life_table.path, file_path);
    sources.wage_growth.path = resolve_relative_path(sources.wage_growth.path, file_path);
    for (auto& pair : sources.worklife_tables) {
        pair.second.path = resolve_relative_path(pair.second.path, file_path);
    }
    for (auto& pair : sources.discount_series) {
        pair.second.path = resolve_relative_path(pair.second.path, file_path);
    }

    return sources;
}

} // namespace losscalc
