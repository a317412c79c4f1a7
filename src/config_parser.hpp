#ifndef LOSSCALC_CONFIG_PARSER_HPP
#define LOSSCALC_CONFIG_PARSER_HPP

#include "case_config.hpp"
#include "table_provider.hpp"
#include <string>

namespace losscalc {

/**
 * @brief Parses a case configuration from a JSON file
 *
 * @param file_path Path to the case JSON file
 * @return Parsed (not yet validated) case configuration
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid
 *         or a required field is missing
 * @throws InvalidConfigError if an enumerated field or date is malformed
 */
CaseConfig parse_case_config_from_file(const std::string& file_path);

/**
 * @brief Parses a case configuration from a JSON string
 */
CaseConfig parse_case_config_from_string(const std::string& json_string);

/**
 * @brief Parses table sources from a JSON file
 *
 * Relative paths are resolved against the directory of the file.
 *
 * @throws ConfigParseError if the file cannot be read or is malformed
 */
TableSources parse_table_sources_from_file(const std::string& file_path);

/**
 * @brief Parses table sources from a JSON string; paths are kept as written
 */
TableSources parse_table_sources_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged. A "local://" prefix is removed
 * before resolving.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace losscalc

#endif // LOSSCALC_CONFIG_PARSER_HPP
