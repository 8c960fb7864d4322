#pragma once

#include "features/lag_rolling_features.hpp"
#include "features/warmup.hpp"
#include "indicators/rolling.hpp"
#include "series/feature_block.hpp"
#include "timeline/canonical_timeline.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// CrossSeriesConfig — instrument relationships for the cross-series block
// ---------------------------------------------------------------------------
struct CrossSeriesConfig {
    using Pair = std::pair<std::string, std::string>;

    std::vector<Pair> correlation_pairs = {
        {"USD_JPY", "EUR_USD"},
        {"USD_JPY", "GBP_USD"},
        {"EUR_USD", "GBP_USD"},
        {"USD_JPY", "AUD_USD"},
    };
    std::vector<size_t> correlation_windows = {24, 72, 168};
    std::vector<std::string> strength_currencies = {"USD", "JPY"};
    size_t strength_window = 24;
    std::vector<Pair> ratio_spreads = {{"EUR_USD", "GBP_USD"}};
    size_t spread_window = 24;

    void validate() const {
        for (auto w : correlation_windows) {
            if (w < 2) throw std::invalid_argument("Correlation windows must be >= 2");
        }
        if (strength_window == 0) throw std::invalid_argument("strength_window must be > 0");
        if (spread_window < 2) throw std::invalid_argument("spread_window must be >= 2");
        for (const auto& [a, b] : correlation_pairs) {
            if (a == b) throw std::invalid_argument("Correlation pair repeats instrument " + a);
        }
    }
};

// ---------------------------------------------------------------------------
// CurrencyPair — BASE/QUOTE legs parsed from an instrument symbol
// ("USD_JPY", "EUR/USD" or "GBPUSD").
// ---------------------------------------------------------------------------
struct CurrencyPair {
    std::string base;
    std::string quote;

    static std::optional<CurrencyPair> parse(const std::string& symbol) {
        std::string s;
        for (char c : symbol) {
            if (c == '_' || c == '/' || c == '-') continue;
            s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        if (s.size() != 6) return std::nullopt;
        for (char c : s) {
            if (c < 'A' || c > 'Z') return std::nullopt;
        }
        return CurrencyPair{s.substr(0, 3), s.substr(3, 3)};
    }
};

// ---------------------------------------------------------------------------
// CrossSeriesFeatureGenerator — features relating two or more instruments:
// rolling return correlations, composite currency strength, ratio spreads.
// Pairs or currencies with no instruments present are skipped.
// ---------------------------------------------------------------------------
class CrossSeriesFeatureGenerator {
public:
    using CloseMap = std::map<std::string, rolling::Series>;

    explicit CrossSeriesFeatureGenerator(const CrossSeriesConfig& config) : config_(config) {}

    // `closes` maps instrument -> close aligned on `timeline`.
    FeatureBlock generate(const CloseMap& closes, const CanonicalTimeline& timeline,
                          WarmupTracker* warmup = nullptr) const {
        FeatureBlock block("cross_series", timeline);
        std::map<std::string, rolling::Series> returns;
        for (const auto& [inst, close] : closes) {
            if (close.size() != timeline.size()) {
                throw std::invalid_argument("Close of '" + inst + "' has " +
                                            std::to_string(close.size()) + " rows, timeline has " +
                                            std::to_string(timeline.size()));
            }
            returns[inst] = rolling::pct_change(close, 1);
        }

        const std::string unit = LagRollingFeatureGenerator::lag_unit(timeline.granularity());
        for (size_t window : config_.correlation_windows) {
            for (const auto& [a, b] : config_.correlation_pairs) {
                auto ra = returns.find(a);
                auto rb = returns.find(b);
                if (ra == returns.end() || rb == returns.end()) continue;
                std::string name = "corr_" + a + "_" + b + "_" + std::to_string(window) + unit;
                emit(block, warmup, name, rolling::correlation(ra->second, rb->second, window), window);
            }
        }

        for (const auto& ccy : config_.strength_currencies) {
            auto index = strength_index(ccy, returns, timeline.size());
            if (!index) continue;
            emit(block, warmup, lower(ccy) + "_strength", std::move(*index), config_.strength_window);
        }

        for (const auto& [a, b] : config_.ratio_spreads) {
            auto ca = closes.find(a);
            auto cb = closes.find(b);
            if (ca == closes.end() || cb == closes.end()) continue;
            rolling::Series ratio(timeline.size(), rolling::UNDEFINED);
            for (size_t i = 0; i < ratio.size(); ++i) {
                ratio[i] = rolling::safe_ratio(ca->second[i], cb->second[i]);
            }
            std::string name = "spread_" + a + "_" + b;
            auto ma = rolling::mean(ratio, config_.spread_window);
            auto sd = rolling::stddev(ratio, config_.spread_window);
            emit(block, warmup, name, std::move(ratio), 0);
            emit(block, warmup, name + "_ma", std::move(ma), config_.spread_window - 1);
            emit(block, warmup, name + "_std", std::move(sd), config_.spread_window - 1);
        }
        return block;
    }

    // Instruments contributing to `ccy`'s index with their sign: +1 where ccy
    // is the base currency, -1 where it is the quote.
    static std::vector<std::pair<std::string, double>> strength_members(
            const std::string& ccy, const std::vector<std::string>& instruments) {
        std::string want = upper(ccy);
        std::vector<std::pair<std::string, double>> members;
        for (const auto& inst : instruments) {
            auto pair = CurrencyPair::parse(inst);
            if (!pair) continue;
            if (pair->base == want) members.emplace_back(inst, 1.0);
            else if (pair->quote == want) members.emplace_back(inst, -1.0);
        }
        return members;
    }

private:
    CrossSeriesConfig config_;

    static void emit(FeatureBlock& block, WarmupTracker* warmup, const std::string& name,
                     rolling::Series values, size_t declared) {
        block.add(name, std::move(values));
        if (warmup) warmup->declare(name, declared);
    }

    // Row mean of the available signed member returns, then a rolling mean.
    std::optional<rolling::Series> strength_index(
            const std::string& ccy, const std::map<std::string, rolling::Series>& returns,
            size_t rows) const {
        std::vector<std::string> instruments;
        for (const auto& [inst, r] : returns) instruments.push_back(inst);
        auto members = strength_members(ccy, instruments);
        if (members.empty()) return std::nullopt;

        rolling::Series composite(rows, rolling::UNDEFINED);
        for (size_t i = 0; i < rows; ++i) {
            double sum = 0.0;
            size_t count = 0;
            for (const auto& [inst, sign] : members) {
                double r = returns.at(inst)[i];
                if (!rolling::is_defined(r)) continue;
                sum += sign * r;
                ++count;
            }
            if (count > 0) composite[i] = sum / static_cast<double>(count);
        }
        return rolling::mean(composite, config_.strength_window);
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
};
