#ifndef LOSSCALC_CSV_READER_HPP
#define LOSSCALC_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace losscalc {

// Line-oriented CSV reader for reference table files.
// Blank lines and lines starting with '#' are skipped; cells are trimmed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, const std::string& source_name = "<stream>",
                       char delimiter = ',');

    // Read the header row; throws ConfigParseError if it lacks any of `required`
    std::vector<std::string> read_header(const std::vector<std::string>& required);

    // Next data row, or an empty vector at end of input
    std::vector<std::string> read_row();

    size_t line_number() const { return line_number_; }

    // Cell conversions; failures throw ConfigParseError naming file, line and column
    double parse_double(const std::string& cell, const std::string& column) const;
    long parse_int(const std::string& cell, const std::string& column) const;

private:
    std::istream& is_;
    std::string source_name_;
    char delimiter_;
    size_t line_number_;

    std::string error_prefix() const;
    static std::string trim(const std::string& s);
};

} // namespace losscalc

#endif // LOSSCALC_CSV_READER_HPP
