#pragma once

#include "fusion_error.hpp"
#include "series/granularity.hpp"
#include "timeline/canonical_timeline.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// FeatureBlock — named group of derived columns sharing the canonical
// timeline index. Produced by exactly one generator.
// ---------------------------------------------------------------------------
class FeatureBlock {
public:
    FeatureBlock() = default;
    FeatureBlock(std::string name, const CanonicalTimeline& timeline)
        : name_(std::move(name)),
          granularity_(timeline.granularity()),
          start_ts_(timeline.start_ts()),
          rows_(timeline.size()) {}

    const std::string& name() const { return name_; }
    Granularity granularity() const { return granularity_; }
    uint64_t start_ts() const { return start_ts_; }
    size_t rows() const { return rows_; }

    void add(const std::string& column, std::vector<double> values) {
        if (values.size() != rows_) {
            throw std::invalid_argument("Block '" + name_ + "' column '" + column + "' has " +
                                        std::to_string(values.size()) + " rows, expected " +
                                        std::to_string(rows_));
        }
        for (const auto& existing : names_) {
            if (existing == column) {
                throw std::invalid_argument("Duplicate column '" + column + "' in block " + name_);
            }
        }
        names_.push_back(column);
        columns_.push_back(std::move(values));
    }

    const std::vector<std::string>& column_names() const { return names_; }
    const std::vector<std::vector<double>>& columns() const { return columns_; }
    size_t column_count() const { return names_.size(); }

    const std::vector<double>& column(const std::string& column) const {
        for (size_t i = 0; i < names_.size(); ++i) {
            if (names_[i] == column) return columns_[i];
        }
        throw std::out_of_range("Block '" + name_ + "' has no column '" + column + "'");
    }

    bool has_column(const std::string& column) const {
        for (const auto& n : names_) {
            if (n == column) return true;
        }
        return false;
    }

    // Throws IncompatibleIndex unless this block is indexed by `timeline`.
    void check_compatible(const CanonicalTimeline& timeline) const {
        if (granularity_ != timeline.granularity()) {
            throw IncompatibleIndex("block '" + name_ + "' is " + granularity_name(granularity_) +
                                    ", timeline is " + granularity_name(timeline.granularity()));
        }
        if (rows_ != timeline.size() || start_ts_ != timeline.start_ts()) {
            throw IncompatibleIndex("block '" + name_ + "' covers " + std::to_string(rows_) +
                                    " rows from " + time_utils::format_timestamp(start_ts_) +
                                    ", timeline covers " + std::to_string(timeline.size()) +
                                    " rows from " + time_utils::format_timestamp(timeline.start_ts()));
        }
    }

private:
    std::string name_;
    Granularity granularity_ = Granularity::HOUR;
    uint64_t start_ts_ = 0;
    size_t rows_ = 0;
    std::vector<std::string> names_;
    std::vector<std::vector<double>> columns_;
};
