#pragma once

#include "io/ohlcv_bars.hpp"
#include "series/granularity.hpp"
#include "series/time_series.hpp"

#include <databento/dbn_file_store.hpp>
#include <databento/record.hpp>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Databento OHLCV input (ohlcv-1m / ohlcv-1h / ohlcv-1d, .dbn or .dbn.zst).
// One instrument per file.
// ---------------------------------------------------------------------------
namespace series_io {

inline TimeSeries read_dbn_ohlcv(const std::string& path, const std::string& name,
                                 Granularity granularity) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    databento::DbnFileStore store{std::filesystem::path(path)};

    OhlcvBarCollector collector(path);
    while (const auto* record = store.NextRecord()) {
        if (const auto* bar = record->GetIf<databento::OhlcvMsg>()) {
            uint64_t ts_ns = static_cast<uint64_t>(bar->hd.ts_event.time_since_epoch().count());
            collector.add_bar(ts_ns, bar->hd.instrument_id, bar->open, bar->high, bar->low,
                              bar->close, bar->volume);
        }
    }
    return collector.to_series(name, granularity);
}

}  // namespace series_io
