#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace losscalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_present_values(const std::vector<CaseResult>& results,
                                         const std::string& filepath) {
    // Build Arrow schema
    auto schema = arrow::schema({
        arrow::field("case_id", arrow::utf8()),
        arrow::field("year_index", arrow::uint32()),
        arrow::field("calendar_year", arrow::int32()),
        arrow::field("year_fraction", arrow::float64()),
        arrow::field("nominal_earnings", arrow::float64()),
        arrow::field("discount_factor", arrow::float64()),
        arrow::field("present_value", arrow::float64()),
        arrow::field("cumulative_pv", arrow::float64())
    });

    arrow::StringBuilder case_id_builder;
    arrow::UInt32Builder year_index_builder;
    arrow::Int32Builder calendar_year_builder;
    arrow::DoubleBuilder year_fraction_builder;
    arrow::DoubleBuilder nominal_builder;
    arrow::DoubleBuilder factor_builder;
    arrow::DoubleBuilder pv_builder;
    arrow::DoubleBuilder cumulative_builder;

    for (const auto& result : results) {
        for (const auto& entry : result.present_value.entries) {
            check(case_id_builder.Append(result.config.case_id), "append case_id");
            check(year_index_builder.Append(entry.year_index), "append year_index");
            check(calendar_year_builder.Append(entry.calendar_year), "append calendar_year");
            check(year_fraction_builder.Append(entry.year_fraction), "append year_fraction");
            check(nominal_builder.Append(entry.nominal_earnings), "append nominal_earnings");
            check(factor_builder.Append(entry.discount_factor), "append discount_factor");
            check(pv_builder.Append(entry.present_value), "append present_value");
            check(cumulative_builder.Append(entry.cumulative_present_value), "append cumulative_pv");
        }
    }

    auto table = arrow::Table::Make(schema, {
        finish(case_id_builder, "case_id"),
        finish(year_index_builder, "year_index"),
        finish(calendar_year_builder, "calendar_year"),
        finish(year_fraction_builder, "year_fraction"),
        finish(nominal_builder, "nominal_earnings"),
        finish(factor_builder, "discount_factor"),
        finish(pv_builder, "present_value"),
        finish(cumulative_builder, "cumulative_pv")
    });

    // Open output file
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_present_values(const std::vector<CaseResult>& /* results */,
                                         const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace losscalc
