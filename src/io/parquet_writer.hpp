#ifndef LOSSCALC_PARQUET_WRITER_HPP
#define LOSSCALC_PARQUET_WRITER_HPP

#include "../case_runner.hpp"
#include <string>
#include <vector>

namespace losscalc {

class ParquetWriter {
public:
    /**
     * Write the present-value schedules of one or more cases to a Parquet file.
     *
     * Output schema, one row per projection year:
     *   - case_id: utf8
     *   - year_index: uint32
     *   - calendar_year: int32
     *   - year_fraction: float64
     *   - nominal_earnings: float64
     *   - discount_factor: float64
     *   - present_value: float64
     *   - cumulative_pv: float64
     *
     * Values are written at full precision.
     *
     * @param results Case results to write, in order
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written or Arrow is unavailable
     */
    static void write_present_values(const std::vector<CaseResult>& results,
                                     const std::string& filepath);

    // True if the build includes Apache Arrow
    static bool available();
};

} // namespace losscalc

#endif // LOSSCALC_PARQUET_WRITER_HPP
