#pragma once

#include "fusion/fusion_guard.hpp"
#include "time_utils.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// ExportConfig
// ---------------------------------------------------------------------------
enum class ExportFormat { CSV, PARQUET };

inline ExportFormat parse_export_format(const std::string& text) {
    if (text == "csv") return ExportFormat::CSV;
    if (text == "parquet") return ExportFormat::PARQUET;
    throw std::invalid_argument("Unknown output format: '" + text + "' (use csv or parquet)");
}

struct ExportConfig {
    std::string output_dir;
    ExportFormat format = ExportFormat::CSV;
    bool include_warmup = true;

    void validate() const {
        if (output_dir.empty()) throw std::invalid_argument("output_dir is required");
    }

    // {output_dir}/{instrument}_features.{csv|parquet}
    std::string output_path(const std::string& instrument) const {
        std::string ext = format == ExportFormat::PARQUET ? ".parquet" : ".csv";
        return (std::filesystem::path(output_dir) / (instrument + "_features" + ext)).string();
    }
};

// ---------------------------------------------------------------------------
// FeatureExporter — CSV rendition of a FusedMatrix. First column is the
// timestamp as "YYYY-MM-DD HH:MM:SS"; values carry 17 significant digits;
// undefined cells are written as NaN.
// ---------------------------------------------------------------------------
class FeatureExporter {
public:
    FeatureExporter() = default;
    explicit FeatureExporter(const ExportConfig& config) : config_(config) {}

    std::string header_line(const FusedMatrix& m) const {
        std::ostringstream ss;
        ss << "timestamp";
        for (const auto& name : m.names) ss << "," << name;
        return ss.str();
    }

    std::string format_row(const FusedMatrix& m, size_t row) const {
        std::string line = time_utils::format_timestamp(m.timestamps[row]);
        for (const auto& col : m.columns) {
            line += ",";
            line += format_double(col[row]);
        }
        return line;
    }

    // First row written; warm-up rows are dropped unless include_warmup.
    size_t first_row(const FusedMatrix& m) const {
        return config_.include_warmup ? 0 : m.warmup_rows;
    }

    void write_csv(const FusedMatrix& m, std::ostream& out) const {
        out << header_line(m) << "\n";
        for (size_t r = first_row(m); r < m.rows(); ++r) {
            out << format_row(m, r) << "\n";
        }
    }

    // Writes {output_dir}/{instrument}_features.csv and returns its path.
    std::string export_csv(const FusedMatrix& m) const {
        if (config_.output_dir.empty()) {
            throw std::invalid_argument("FeatureExporter: output_dir not set");
        }
        if (!std::filesystem::exists(config_.output_dir)) {
            throw std::runtime_error("Output directory does not exist: " + config_.output_dir);
        }
        std::string path = config_.output_path(m.instrument);
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
        write_csv(m, file);
        file.close();
        if (file.fail()) throw std::runtime_error("Failed writing output file: " + path);
        return path;
    }

    static std::string format_double(double val) {
        if (std::isnan(val)) return "NaN";
        if (std::isinf(val)) return val > 0 ? "Inf" : "-Inf";
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.17g", val);
        return buf;
    }

private:
    ExportConfig config_;
};
