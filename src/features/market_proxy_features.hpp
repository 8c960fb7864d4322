#pragma once

#include "features/price_frame.hpp"
#include "features/warmup.hpp"
#include "indicators/rolling.hpp"
#include "series/feature_block.hpp"
#include "timeline/canonical_timeline.hpp"

#include <cstddef>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// MarketProxyFeatureGenerator — sentiment proxies read off the instrument's
// own candles: volume surprise, opening gap and spread widening.
// Volume and spread columns are only emitted when the source carries them.
// ---------------------------------------------------------------------------
class MarketProxyFeatureGenerator {
public:
    static constexpr size_t DEFAULT_WINDOW = 20;

    explicit MarketProxyFeatureGenerator(size_t window = DEFAULT_WINDOW) : window_(window) {}

    FeatureBlock generate(const PriceFrame& frame, const CanonicalTimeline& timeline,
                          WarmupTracker* warmup = nullptr) const {
        FeatureBlock block("market_proxy", timeline);
        const size_t n = frame.size();

        if (frame.has_volume) {
            emit(block, warmup, "volume_change", rolling::pct_change(frame.volume, 1), 1);
            emit(block, warmup, "volume_ma_ratio", ratio_to_mean(frame.volume), window_ - 1);
        }

        // (open - previous close) / previous close
        rolling::Series gap(n, rolling::UNDEFINED);
        for (size_t i = 1; i < n; ++i) {
            gap[i] = rolling::safe_ratio(frame.open[i] - frame.close[i - 1], frame.close[i - 1]);
        }
        emit(block, warmup, "gap", std::move(gap), 1);

        if (frame.has_spread) {
            emit(block, warmup, "spread_ma_ratio", ratio_to_mean(frame.spread), window_ - 1);
        }
        return block;
    }

private:
    size_t window_;

    rolling::Series ratio_to_mean(const rolling::Series& x) const {
        auto avg = rolling::mean(x, window_);
        rolling::Series out(x.size(), rolling::UNDEFINED);
        for (size_t i = 0; i < x.size(); ++i) out[i] = rolling::safe_ratio(x[i], avg[i]);
        return out;
    }

    static void emit(FeatureBlock& block, WarmupTracker* warmup, const std::string& name,
                     rolling::Series values, size_t declared) {
        block.add(name, std::move(values));
        if (warmup) warmup->declare(name, declared);
    }
};
