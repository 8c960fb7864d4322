#pragma once

#include "series/granularity.hpp"
#include "series/time_series.hpp"
#include "indicators/rolling.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// series_io — CSV input for TimeSeries
//
// Layout: header row, first column a timestamp, remaining columns numeric.
// Empty, NaN, nan, "." and null cells are undefined. Rows may arrive in any
// order; duplicate timestamps keep the last row.
// ---------------------------------------------------------------------------
namespace series_io {

inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Comma split with trimming; a field wrapped in double quotes loses them.
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == ',' && !quoted) {
            fields.push_back(trim(cur));
            cur.clear();
        } else if (c != '\r') {
            cur.push_back(c);
        }
    }
    fields.push_back(trim(cur));
    return fields;
}

inline bool is_undefined_token(const std::string& cell) {
    return cell.empty() || cell == "NaN" || cell == "nan" || cell == "NAN" ||
           cell == "." || cell == "null" || cell == "NULL";
}

// Parse one numeric cell; throws std::runtime_error naming `where`.
inline double parse_cell(const std::string& cell, const std::string& where) {
    if (is_undefined_token(cell)) return rolling::UNDEFINED;
    char* end = nullptr;
    double v = std::strtod(cell.c_str(), &end);
    if (end == cell.c_str() || *end != '\0') {
        throw std::runtime_error(where + ": not a number: '" + cell + "'");
    }
    return v;
}

inline TimeSeries read_csv_stream(std::istream& in, const std::string& name,
                                  Granularity granularity, const std::string& source = "<stream>") {
    std::string line;
    size_t line_no = 0;
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        ++line_no;
        if (!trim(line).empty()) {
            header = split_csv_line(line);
            break;
        }
    }
    if (header.empty()) {
        throw std::runtime_error(source + ": missing header row");
    }
    const size_t width = header.size();

    std::map<uint64_t, std::vector<double>> rows;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        std::string where = source + ":" + std::to_string(line_no);
        auto cells = split_csv_line(line);
        if (cells.size() != width) {
            throw std::runtime_error(where + ": expected " + std::to_string(width) +
                                     " fields, got " + std::to_string(cells.size()));
        }
        auto ts = time_utils::parse_timestamp(cells[0]);
        if (!ts) throw std::runtime_error(where + ": bad timestamp '" + cells[0] + "'");

        std::vector<double> values(width - 1);
        for (size_t c = 1; c < width; ++c) values[c - 1] = parse_cell(cells[c], where);
        rows[*ts] = std::move(values);
    }

    std::vector<uint64_t> timestamps;
    timestamps.reserve(rows.size());
    std::vector<std::vector<double>> cols(width - 1);
    for (const auto& [ts, values] : rows) {
        timestamps.push_back(ts);
        for (size_t c = 0; c < values.size(); ++c) cols[c].push_back(values[c]);
    }

    TimeSeries series(name, granularity, std::move(timestamps));
    for (size_t c = 1; c < width; ++c) {
        series.add_column(header[c], std::move(cols[c - 1]));
    }
    return series;
}

inline TimeSeries read_csv_series(const std::string& path, const std::string& name,
                                  Granularity granularity) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return read_csv_stream(in, name, granularity, path);
}

// "data/USD_JPY_full_history.csv" -> "USD_JPY"; ".dbn.zst" counts as one
// extension.
inline std::string instrument_from_path(const std::string& path) {
    std::string stem = std::filesystem::path(path).filename().string();
    for (const char* ext : {".dbn.zst", ".dbn", ".csv"}) {
        std::string e(ext);
        if (stem.size() > e.size() && stem.compare(stem.size() - e.size(), e.size(), e) == 0) {
            stem.resize(stem.size() - e.size());
            break;
        }
    }
    const std::string suffix = "_full_history";
    if (stem.size() > suffix.size() &&
        stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0) {
        stem.resize(stem.size() - suffix.size());
    }
    return stem;
}

inline bool is_dbn_path(const std::string& path) {
    auto name = std::filesystem::path(path).filename().string();
    return name.find(".dbn") != std::string::npos;
}

// Price files (.csv, .dbn, .dbn.zst) in `dir`, sorted by path.
inline std::vector<std::string> list_price_files(const std::string& dir) {
    if (!std::filesystem::is_directory(dir)) {
        throw std::runtime_error("Not a directory: " + dir);
    }
    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        auto p = entry.path().string();
        if (entry.path().extension() == ".csv" || is_dbn_path(p)) files.push_back(p);
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace series_io
