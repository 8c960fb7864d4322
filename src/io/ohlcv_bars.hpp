#pragma once

#include "series/granularity.hpp"
#include "series/time_series.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace series_io {

inline double dbn_fixed_to_double(int64_t fixed) {
    return static_cast<double>(fixed) / 1e9;
}

// ---------------------------------------------------------------------------
// OhlcvBarCollector — gathers OHLCV bars of a single instrument into a
// TimeSeries. Prices arrive fixed-point (1e-9). A bar repeating a timestamp
// replaces the earlier one; a bar from a second instrument id throws.
// ---------------------------------------------------------------------------
class OhlcvBarCollector {
public:
    explicit OhlcvBarCollector(std::string source) : source_(std::move(source)) {}

    void add_bar(uint64_t ts_ns, uint32_t instrument_id, int64_t open, int64_t high,
                 int64_t low, int64_t close, uint64_t volume) {
        if (!instrument_id_) {
            instrument_id_ = instrument_id;
        } else if (*instrument_id_ != instrument_id) {
            throw std::runtime_error(source_ + ": holds instrument ids " +
                                     std::to_string(*instrument_id_) + " and " +
                                     std::to_string(instrument_id) +
                                     "; expected one instrument per file");
        }
        bars_[ts_ns] = {dbn_fixed_to_double(open), dbn_fixed_to_double(high),
                        dbn_fixed_to_double(low), dbn_fixed_to_double(close),
                        static_cast<double>(volume)};
    }

    std::optional<uint32_t> instrument_id() const { return instrument_id_; }
    size_t size() const { return bars_.size(); }

    TimeSeries to_series(const std::string& name, Granularity granularity) const {
        std::vector<uint64_t> timestamps;
        std::array<std::vector<double>, 5> cols;
        for (const auto& [ts, v] : bars_) {
            timestamps.push_back(ts);
            for (size_t c = 0; c < v.size(); ++c) cols[c].push_back(v[c]);
        }

        TimeSeries series(name, granularity, std::move(timestamps));
        const char* names[] = {"open", "high", "low", "close", "volume"};
        for (size_t c = 0; c < cols.size(); ++c) series.add_column(names[c], std::move(cols[c]));
        return series;
    }

private:
    std::string source_;
    std::optional<uint32_t> instrument_id_;
    std::map<uint64_t, std::array<double, 5>> bars_;
};

}  // namespace series_io
