#include "csv_reader.hpp"
#include "../errors.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace losscalc {

CsvReader::CsvReader(std::istream& is, const std::string& source_name, char delimiter)
    : is_(is), source_name_(source_name), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_header(const std::vector<std::string>& required) {
    std::vector<std::string> header = read_row();
    if (header.empty()) {
        throw ConfigParseError(source_name_ + ": missing header row");
    }
    for (const auto& column : required) {
        if (std::find(header.begin(), header.end(), column) == header.end()) {
            throw ConfigParseError(error_prefix() + "header is missing column '" + column + "'");
        }
    }
    return header;
}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    while (std::getline(is_, line)) {
        ++line_number_;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        std::stringstream ss(trimmed);
        std::string cell;
        while (std::getline(ss, cell, delimiter_)) {
            row.push_back(trim(cell));
        }
        // "a,b," has an empty trailing cell that getline drops
        if (trimmed.back() == delimiter_) {
            row.emplace_back();
        }
        break;
    }

    return row;
}

double CsvReader::parse_double(const std::string& cell, const std::string& column) const {
    try {
        size_t consumed = 0;
        double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigParseError(error_prefix() + "column '" + column + "' is not a number: '" + cell + "'");
    }
}

long CsvReader::parse_int(const std::string& cell, const std::string& column) const {
    try {
        size_t consumed = 0;
        long value = std::stol(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigParseError(error_prefix() + "column '" + column + "' is not an integer: '" + cell + "'");
    }
}

std::string CsvReader::error_prefix() const {
    return source_name_ + ":" + std::to_string(line_number_) + ": ";
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace losscalc
