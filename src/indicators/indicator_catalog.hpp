#pragma once

#include "features/price_frame.hpp"
#include "features/warmup.hpp"
#include "indicators/momentum.hpp"
#include "indicators/moving_averages.hpp"
#include "indicators/oscillators.hpp"
#include "indicators/rolling.hpp"
#include "indicators/trend.hpp"
#include "indicators/volatility.hpp"
#include "indicators/volume.hpp"
#include "series/feature_block.hpp"
#include "timeline/canonical_timeline.hpp"

#include <cmath>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// IndicatorParams — parameter sets for the technical catalog
// ---------------------------------------------------------------------------
struct IndicatorParams {
    std::vector<size_t> rsi_periods = {5, 7, 9, 14, 21, 28};
    std::vector<size_t> stoch_periods = {5, 9, 14, 21};
    size_t stoch_smooth = 3;
    std::vector<size_t> williams_periods = {7, 14, 21};
    std::vector<size_t> cci_periods = {10, 14, 20};
    std::vector<size_t> atr_periods = {7, 14, 21};
    std::vector<size_t> bollinger_windows = {10, 20, 50};
    double bollinger_k = 2.0;
    std::vector<std::pair<size_t, size_t>> macd_spans = {{5, 10}, {12, 26}, {19, 39}};
    size_t macd_signal = 9;
    size_t adx_period = 14;
    size_t mfi_period = 14;
    size_t obv_window = 20;

    void validate() const {
        auto positive = [](const std::vector<size_t>& v, const char* what) {
            for (auto p : v) {
                if (p == 0) throw std::invalid_argument(std::string(what) + " period must be > 0");
            }
        };
        positive(rsi_periods, "RSI");
        positive(stoch_periods, "Stochastic");
        positive(williams_periods, "Williams %R");
        positive(cci_periods, "CCI");
        positive(atr_periods, "ATR");
        for (auto w : bollinger_windows) {
            if (w < 2) throw std::invalid_argument("Bollinger window must be >= 2");
        }
        if (!(bollinger_k >= 0.0) || std::isinf(bollinger_k)) {
            throw std::invalid_argument("Bollinger k must be finite and >= 0");
        }
        for (const auto& [fast, slow] : macd_spans) {
            if (fast == 0 || slow == 0 || fast >= slow) {
                throw std::invalid_argument("MACD spans need 0 < fast < slow");
            }
        }
        if (stoch_smooth == 0 || macd_signal == 0 || adx_period == 0 ||
            mfi_period == 0 || obv_window == 0) {
            throw std::invalid_argument("Indicator periods must be > 0");
        }
    }
};

// ---------------------------------------------------------------------------
// IndicatorDefinition — pure mapping from a price frame to named outputs,
// each with its declared warm-up (leading rows undefined on clean input).
// ---------------------------------------------------------------------------
struct IndicatorOutput {
    std::string column;
    size_t warmup = 0;
};

struct IndicatorDefinition {
    std::string name;
    std::vector<IndicatorOutput> outputs;
    std::string stability;        // numeric-stability policy, for the catalog listing
    bool requires_volume = false;
    std::function<std::vector<rolling::Series>(const PriceFrame&)> compute;
};

namespace detail {

inline std::string suffix(size_t p) { return std::to_string(p); }

}  // namespace detail

inline std::vector<IndicatorDefinition> build_indicator_catalog(const IndicatorParams& p) {
    using detail::suffix;
    p.validate();
    std::vector<IndicatorDefinition> catalog;
    const std::string eps_guard = "denominator + 1e-10";

    for (size_t period : p.rsi_periods) {
        catalog.push_back({"rsi_" + suffix(period),
                           {{"rsi_" + suffix(period), period}},
                           eps_guard, false,
                           [period](const PriceFrame& f) {
                               return std::vector<rolling::Series>{indicators::rsi(f.close, period)};
                           }});
    }

    for (size_t period : p.stoch_periods) {
        size_t smooth = p.stoch_smooth;
        catalog.push_back({"stoch_" + suffix(period),
                           {{"stoch_k_" + suffix(period), period - 1},
                            {"stoch_d_" + suffix(period), period + smooth - 2}},
                           eps_guard, false,
                           [period, smooth](const PriceFrame& f) {
                               auto st = indicators::stochastic(f.high, f.low, f.close, period, smooth);
                               return std::vector<rolling::Series>{st.k, st.d};
                           }});
    }

    for (size_t period : p.williams_periods) {
        catalog.push_back({"williams_r_" + suffix(period),
                           {{"williams_r_" + suffix(period), period - 1}},
                           eps_guard, false,
                           [period](const PriceFrame& f) {
                               return std::vector<rolling::Series>{
                                   indicators::williams_r(f.high, f.low, f.close, period)};
                           }});
    }

    for (size_t period : p.cci_periods) {
        catalog.push_back({"cci_" + suffix(period),
                           {{"cci_" + suffix(period), period - 1}},
                           eps_guard, false,
                           [period](const PriceFrame& f) {
                               return std::vector<rolling::Series>{
                                   indicators::cci(f.high, f.low, f.close, period)};
                           }});
    }

    for (size_t period : p.atr_periods) {
        catalog.push_back({"atr_" + suffix(period),
                           {{"atr_" + suffix(period), period - 1},
                            {"atr_pct_" + suffix(period), period - 1}},
                           "zero close -> undefined", false,
                           [period](const PriceFrame& f) {
                               auto a = indicators::atr(f.high, f.low, f.close, period);
                               rolling::Series pct(a.size(), rolling::UNDEFINED);
                               for (size_t i = 0; i < a.size(); ++i) {
                                   pct[i] = rolling::safe_ratio(a[i], f.close[i]);
                               }
                               return std::vector<rolling::Series>{a, pct};
                           }});
    }

    for (size_t window : p.bollinger_windows) {
        double k = p.bollinger_k;
        std::string w = suffix(window);
        catalog.push_back({"bollinger_" + w,
                           {{"bb_upper_" + w, window - 1},
                            {"bb_lower_" + w, window - 1},
                            {"bb_width_" + w, window - 1},
                            {"bb_position_" + w, window - 1}},
                           eps_guard, false,
                           [window, k](const PriceFrame& f) {
                               auto bb = indicators::bollinger(f.close, window, k);
                               return std::vector<rolling::Series>{bb.upper, bb.lower, bb.width, bb.position};
                           }});
    }

    for (const auto& [fast, slow] : p.macd_spans) {
        size_t signal = p.macd_signal;
        std::string tag = suffix(fast) + "_" + suffix(slow);
        catalog.push_back({"macd_" + tag,
                           {{"macd_" + tag, 0},
                            {"macd_signal_" + tag, 0},
                            {"macd_hist_" + tag, 0}},
                           "none (difference of averages)", false,
                           [fast = fast, slow = slow, signal](const PriceFrame& f) {
                               auto m = indicators::macd(f.close, fast, slow, signal);
                               return std::vector<rolling::Series>{m.macd, m.signal, m.histogram};
                           }});
    }

    {
        size_t period = p.adx_period;
        catalog.push_back({"adx",
                           {{"adx", 2 * period - 1},
                            {"plus_di", period},
                            {"minus_di", period},
                            {"di_diff", period}},
                           eps_guard, false,
                           [period](const PriceFrame& f) {
                               auto a = indicators::adx(f.high, f.low, f.close, period);
                               rolling::Series diff(a.plus_di.size(), rolling::UNDEFINED);
                               for (size_t i = 0; i < diff.size(); ++i) {
                                   diff[i] = a.plus_di[i] - a.minus_di[i];
                               }
                               return std::vector<rolling::Series>{a.adx, a.plus_di, a.minus_di, diff};
                           }});
    }

    {
        size_t period = p.mfi_period;
        catalog.push_back({"mfi",
                           {{"mfi", period}},
                           eps_guard, true,
                           [period](const PriceFrame& f) {
                               return std::vector<rolling::Series>{
                                   indicators::mfi(f.high, f.low, f.close, f.volume, period)};
                           }});
    }

    {
        size_t window = p.obv_window;
        std::string w = suffix(window);
        catalog.push_back({"obv",
                           {{"obv", 0},
                            {"obv_sma_" + w, window - 1},
                            {"obv_momentum", window}},
                           "none (cumulative sum)", true,
                           [window](const PriceFrame& f) {
                               auto o = indicators::obv(f.close, f.volume);
                               auto sma = indicators::sma(o, window);
                               auto lagged = rolling::shift(o, window);
                               rolling::Series mom(o.size(), rolling::UNDEFINED);
                               for (size_t i = 0; i < o.size(); ++i) mom[i] = o[i] - lagged[i];
                               return std::vector<rolling::Series>{o, sma, mom};
                           }});
    }

    return catalog;
}

// ---------------------------------------------------------------------------
// TechnicalIndicatorGenerator — runs the catalog into the "technical" block
// ---------------------------------------------------------------------------
class TechnicalIndicatorGenerator {
public:
    explicit TechnicalIndicatorGenerator(const IndicatorParams& params)
        : catalog_(build_indicator_catalog(params)) {}

    const std::vector<IndicatorDefinition>& catalog() const { return catalog_; }

    FeatureBlock generate(const PriceFrame& frame, const CanonicalTimeline& timeline,
                          WarmupTracker* warmup = nullptr) const {
        FeatureBlock block("technical", timeline);
        for (const auto& def : catalog_) {
            if (def.requires_volume && !frame.has_volume) continue;
            auto outputs = def.compute(frame);
            if (outputs.size() != def.outputs.size()) {
                throw std::logic_error("Indicator '" + def.name + "' produced " +
                                       std::to_string(outputs.size()) + " outputs, declared " +
                                       std::to_string(def.outputs.size()));
            }
            for (size_t k = 0; k < outputs.size(); ++k) {
                block.add(def.outputs[k].column, std::move(outputs[k]));
                if (warmup) warmup->declare(def.outputs[k].column, def.outputs[k].warmup);
            }
        }
        return block;
    }

private:
    std::vector<IndicatorDefinition> catalog_;
};
