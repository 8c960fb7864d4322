#pragma once

#include "series/granularity.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TimeSeries — timestamp-indexed table of named numeric columns at a declared
// native granularity. NaN marks an undefined value.
//
// Invariant: timestamps strictly increasing (checked by validate()).
// ---------------------------------------------------------------------------
class TimeSeries {
public:
    TimeSeries() = default;
    TimeSeries(std::string name, Granularity granularity)
        : name_(std::move(name)), granularity_(granularity) {}

    TimeSeries(std::string name, Granularity granularity, std::vector<uint64_t> timestamps)
        : name_(std::move(name)), granularity_(granularity),
          timestamps_(std::move(timestamps)) {}

    const std::string& name() const { return name_; }
    Granularity granularity() const { return granularity_; }
    const std::vector<uint64_t>& timestamps() const { return timestamps_; }

    size_t size() const { return timestamps_.size(); }
    bool empty() const { return timestamps_.empty(); }

    uint64_t start_ts() const {
        if (timestamps_.empty()) throw std::logic_error("start_ts() on empty series: " + name_);
        return timestamps_.front();
    }

    uint64_t end_ts() const {
        if (timestamps_.empty()) throw std::logic_error("end_ts() on empty series: " + name_);
        return timestamps_.back();
    }

    void set_timestamps(std::vector<uint64_t> timestamps) {
        if (!column_names_.empty() && timestamps.size() != timestamps_.size()) {
            throw std::invalid_argument("set_timestamps: length change with existing columns in " + name_);
        }
        timestamps_ = std::move(timestamps);
    }

    void add_column(const std::string& column, std::vector<double> values) {
        if (values.size() != timestamps_.size()) {
            throw std::invalid_argument("Column '" + column + "' has " +
                                        std::to_string(values.size()) + " values, series '" +
                                        name_ + "' has " + std::to_string(timestamps_.size()) +
                                        " timestamps");
        }
        if (has_column(column)) {
            throw std::invalid_argument("Duplicate column '" + column + "' in series " + name_);
        }
        column_names_.push_back(column);
        columns_.push_back(std::move(values));
    }

    bool has_column(const std::string& column) const {
        return find_column(column) >= 0;
    }

    const std::vector<double>& column(const std::string& column) const {
        int idx = find_column(column);
        if (idx < 0) {
            throw std::out_of_range("Series '" + name_ + "' has no column '" + column + "'");
        }
        return columns_[static_cast<size_t>(idx)];
    }

    const std::vector<std::string>& column_names() const { return column_names_; }
    size_t column_count() const { return column_names_.size(); }

    // Throws std::invalid_argument unless timestamps are strictly increasing.
    void validate() const {
        for (size_t i = 1; i < timestamps_.size(); ++i) {
            if (timestamps_[i] <= timestamps_[i - 1]) {
                throw std::invalid_argument(
                    "Series '" + name_ + "' timestamps not strictly increasing at row " +
                    std::to_string(i) + " (" + time_utils::format_timestamp(timestamps_[i]) + ")");
            }
        }
    }

private:
    std::string name_;
    Granularity granularity_ = Granularity::HOUR;
    std::vector<uint64_t> timestamps_;
    std::vector<std::string> column_names_;
    std::vector<std::vector<double>> columns_;

    int find_column(const std::string& column) const {
        for (size_t i = 0; i < column_names_.size(); ++i) {
            if (column_names_[i] == column) return static_cast<int>(i);
        }
        return -1;
    }
};
