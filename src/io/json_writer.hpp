#ifndef LOSSCALC_IO_JSON_WRITER_HPP
#define LOSSCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../case_runner.hpp"

namespace losscalc {
namespace io {

// Write a case result as JSON: case_id, summary, one member per sheet
// (life_expectancy, worklife, wage_growth, projections, discount_factors,
// present_value) and the audit_log. Numbers are printed with fixed
// precision; this is the only place values are rounded.
void write_case_result_json(std::ostream& os, const CaseResult& result,
                            bool pretty_print = true);

void write_case_result_json(const std::string& filepath, const CaseResult& result,
                            bool pretty_print = true);

// Write batch outcomes as {"results": [...], "failures": [...]}
void write_batch_json(std::ostream& os, const std::vector<CaseOutcome>& outcomes,
                      bool pretty_print = true);

void write_batch_json(const std::string& filepath, const std::vector<CaseOutcome>& outcomes,
                      bool pretty_print = true);

// Escape a string for inclusion in a JSON document (without quotes)
std::string escape_json(const std::string& value);

} // namespace io
} // namespace losscalc

#endif // LOSSCALC_IO_JSON_WRITER_HPP
