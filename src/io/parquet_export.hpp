#pragma once

#include "fusion/fusion_guard.hpp"
#include "io/feature_export.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Parquet writer — `timestamp` int64 ns since epoch plus one float64 column
// per feature, ZSTD compressed, a single row group.
// ---------------------------------------------------------------------------
namespace parquet_export {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) throw std::runtime_error(what + ": " + status.ToString());
}

inline std::shared_ptr<arrow::Table> to_table(const FusedMatrix& m, size_t first_row = 0) {
    const int64_t rows = static_cast<int64_t>(m.rows() - std::min(first_row, m.rows()));

    arrow::FieldVector fields;
    fields.push_back(arrow::field("timestamp", arrow::int64()));
    for (const auto& name : m.names) fields.push_back(arrow::field(name, arrow::float64()));
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;
    {
        arrow::Int64Builder b;
        check(b.Reserve(rows), "reserve timestamp");
        for (size_t r = first_row; r < m.rows(); ++r) {
            check(b.Append(static_cast<int64_t>(m.timestamps[r])), "append timestamp");
        }
        check(b.Finish(&arr), "finish timestamp");
        arrays.push_back(arr);
    }
    for (size_t c = 0; c < m.columns.size(); ++c) {
        arrow::DoubleBuilder b;
        if (rows > 0) {
            check(b.AppendValues(m.columns[c].data() + first_row, rows), "append " + m.names[c]);
        }
        check(b.Finish(&arr), "finish " + m.names[c]);
        arrays.push_back(arr);
    }
    return arrow::Table::Make(schema, arrays, rows);
}

inline void write_parquet(const FusedMatrix& m, const std::string& path, size_t first_row = 0) {
    auto table = to_table(m, first_row);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk = std::max<int64_t>(table->num_rows(), 1);
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, chunk, props),
          "Failed to write Parquet " + path);
    check(outfile->Close(), "close " + path);
}

// Writes {output_dir}/{instrument}_features.parquet and returns its path.
inline std::string export_parquet(const FusedMatrix& m, ExportConfig config) {
    config.format = ExportFormat::PARQUET;
    FeatureExporter exporter(config);
    std::string path = config.output_path(m.instrument);
    write_parquet(m, path, exporter.first_row(m));
    return path;
}

}  // namespace parquet_export
