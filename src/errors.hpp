#ifndef LOSSCALC_ERRORS_HPP
#define LOSSCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace losscalc {

// Base for every typed failure raised by the calculation pipeline.
// Carries the stage that failed and the key that could not be resolved,
// so callers can report exactly what was missing or malformed.
class LossCalcError : public std::runtime_error {
public:
    LossCalcError(const std::string& stage, const std::string& key, const std::string& message)
        : std::runtime_error(stage + ": " + message + " [" + key + "]")
        , stage_(stage)
        , key_(key) {}

    const std::string& stage() const { return stage_; }
    const std::string& key() const { return key_; }

private:
    std::string stage_;
    std::string key_;
};

// Reference data for a requested combination does not exist.
class TableLookupError : public LossCalcError {
public:
    TableLookupError(const std::string& stage, const std::string& key, const std::string& message)
        : LossCalcError(stage, key, message) {}
};

// Age is negative or beyond the life table's range.
class InvalidAgeError : public LossCalcError {
public:
    InvalidAgeError(const std::string& stage, const std::string& key, const std::string& message)
        : LossCalcError(stage, key, message) {}
};

// Case configuration violates an input invariant.
class InvalidConfigError : public LossCalcError {
public:
    InvalidConfigError(const std::string& stage, const std::string& key, const std::string& message)
        : LossCalcError(stage, key, message) {}
};

// JSON or CSV input could not be read or parsed.
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace losscalc

#endif // LOSSCALC_ERRORS_HPP
