#pragma once

#include "indicators/rolling.hpp"
#include "series/feature_block.hpp"

#include <string>

// ---------------------------------------------------------------------------
// PriceFrame — OHLCV view of an instrument's aligned price block.
// Missing high/low fall back to close; volume and spread are optional.
// ---------------------------------------------------------------------------
struct PriceFrame {
    std::string instrument;
    rolling::Series open;
    rolling::Series high;
    rolling::Series low;
    rolling::Series close;
    rolling::Series volume;
    rolling::Series spread;
    bool has_volume = false;
    bool has_spread = false;

    size_t size() const { return close.size(); }

    // Column names are looked up as `prefix + name` (e.g. "" + "close").
    static PriceFrame from_block(const std::string& instrument, const FeatureBlock& block,
                                 const std::string& prefix = "") {
        PriceFrame f;
        f.instrument = instrument;
        f.close = block.column(prefix + "close");
        f.high = block.has_column(prefix + "high") ? block.column(prefix + "high") : f.close;
        f.low = block.has_column(prefix + "low") ? block.column(prefix + "low") : f.close;
        f.open = block.has_column(prefix + "open") ? block.column(prefix + "open") : f.close;
        if (block.has_column(prefix + "volume")) {
            f.volume = block.column(prefix + "volume");
            f.has_volume = true;
        } else {
            f.volume.assign(f.close.size(), rolling::UNDEFINED);
        }
        if (block.has_column(prefix + "spread")) {
            f.spread = block.column(prefix + "spread");
            f.has_spread = true;
        } else if (block.has_column(prefix + "ask_close") && block.has_column(prefix + "bid_close")) {
            const auto& ask = block.column(prefix + "ask_close");
            const auto& bid = block.column(prefix + "bid_close");
            f.spread.assign(f.close.size(), rolling::UNDEFINED);
            for (size_t i = 0; i < f.spread.size(); ++i) f.spread[i] = ask[i] - bid[i];
            f.has_spread = true;
        } else {
            f.spread.assign(f.close.size(), rolling::UNDEFINED);
        }
        return f;
    }
};
