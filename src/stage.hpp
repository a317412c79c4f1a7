#ifndef LOSSCALC_STAGE_HPP
#define LOSSCALC_STAGE_HPP

#include <cstdint>
#include <string>

namespace losscalc {

// Pipeline stages in execution order
enum class Stage : uint8_t {
    LifeExpectancy = 0,
    WorkLife = 1,
    WageGrowth = 2,
    Earnings = 3,
    Discounting = 4
};

inline std::string to_string(Stage stage) {
    switch (stage) {
        case Stage::LifeExpectancy: return "life_expectancy";
        case Stage::WorkLife: return "worklife";
        case Stage::WageGrowth: return "wage_growth";
        case Stage::Earnings: return "earnings";
        case Stage::Discounting: return "discounting";
    }
    return "unknown";
}

} // namespace losscalc

#endif // LOSSCALC_STAGE_HPP
