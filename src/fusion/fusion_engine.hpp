#pragma once

#include "alignment/alignment_adapter.hpp"
#include "config/engine_config.hpp"
#include "features/calendar_features.hpp"
#include "features/cross_series_features.hpp"
#include "features/lag_rolling_features.hpp"
#include "features/macro_spreads.hpp"
#include "features/market_proxy_features.hpp"
#include "features/price_frame.hpp"
#include "features/source_transforms.hpp"
#include "features/warmup.hpp"
#include "fusion/fusion_guard.hpp"
#include "fusion_error.hpp"
#include "indicators/indicator_catalog.hpp"
#include "series/feature_block.hpp"
#include "series/time_series.hpp"
#include "timeline/canonical_timeline.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <iostream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// EngineInputs — already-parsed series handed to the engine
// ---------------------------------------------------------------------------
struct ExternalInput {
    TimeSeries series;
    AlignmentPolicy policy;
    std::vector<SourceTransform> transforms;  // applied at native frequency, before alignment
};

struct EngineInputs {
    std::vector<TimeSeries> prices;        // one per instrument; name = instrument
    std::vector<ExternalInput> externals;  // shared by every instrument
};

// ---------------------------------------------------------------------------
// InstrumentResult — outcome for one instrument of a batch
// ---------------------------------------------------------------------------
struct InstrumentResult {
    std::string instrument;
    bool ok = false;
    std::string error;
    FusedMatrix matrix;
    FusionReport report;
    WarmupTracker warmup;
};

// ---------------------------------------------------------------------------
// FusionEngine — timeline -> alignment -> feature blocks -> fusion, per
// instrument. A failing instrument is logged and recorded; the others still
// complete. With num_workers > 1 instruments run concurrently; each writes
// only its own result slot, so output does not depend on worker count.
// ---------------------------------------------------------------------------
class FusionEngine {
public:
    explicit FusionEngine(const EngineConfig& config, std::ostream* log = &std::cerr)
        : config_(config), log_(log) {
        config_.validate();
    }

    const EngineConfig& config() const { return config_; }

    // Span of the usable price series clipped to the window. A series that
    // will fail in its own pipeline does not contribute.
    CanonicalTimeline build_timeline(const EngineInputs& inputs) const {
        TimelineBuilder builder(config_.timeline);
        std::vector<const TimeSeries*> hosted;
        bool any_hostable = false;
        for (const auto& p : inputs.prices) {
            if (!is_finer_or_equal(config_.timeline.granularity, p.granularity())) continue;
            any_hostable = true;
            if (usable_price_series(p) && !p.empty()) hosted.push_back(&p);
        }
        if (!inputs.prices.empty() && !any_hostable) {
            throw GranularityMismatch("no price series can be hosted on a " +
                                      granularity_name(config_.timeline.granularity) +
                                      " timeline");
        }
        if (hosted.empty()) {
            throw std::invalid_argument("Cannot derive a timeline: no non-empty, ordered price "
                                        "series with a close column");
        }
        return builder.build(hosted);
    }

    // Cross-series block from every price series that aligns onto `timeline`.
    FeatureBlock build_cross_block(const EngineInputs& inputs, const CanonicalTimeline& timeline,
                                   WarmupTracker* warmup = nullptr) const {
        AlignmentAdapter adapter(timeline);
        CrossSeriesFeatureGenerator::CloseMap closes;
        for (const auto& p : inputs.prices) {
            if (!is_finer_or_equal(timeline.granularity(), p.granularity())) continue;
            if (!usable_price_series(p)) continue;  // reported by its own pipeline
            auto aligned = adapter.align(p);
            closes[p.name()] = aligned.column("close");
        }
        return CrossSeriesFeatureGenerator(config_.cross_series).generate(closes, timeline, warmup);
    }

    // Ordered timestamps and a close column.
    static bool usable_price_series(const TimeSeries& p) {
        if (!p.has_column("close")) return false;
        try {
            p.validate();
        } catch (const std::invalid_argument&) {
            return false;
        }
        return true;
    }

    // Full pipeline for one instrument. Throws on any fatal condition.
    FusedMatrix fuse_instrument(const TimeSeries& prices, const EngineInputs& inputs,
                                const CanonicalTimeline& timeline, const FeatureBlock& cross,
                                const WarmupTracker& cross_warmup, FusionReport* report = nullptr,
                                WarmupTracker* warmup_out = nullptr) const {
        FusionReport local_report;
        FusionReport& rep = report ? *report : local_report;
        WarmupTracker warmup;
        warmup.merge(cross_warmup);

        prices.validate();
        AlignmentAdapter adapter(timeline);
        if (prices.empty()) rep.empty_sources.push_back(prices.name());
        FeatureBlock price_block = adapter.align(prices);

        std::vector<FeatureBlock> externals;
        externals.reserve(inputs.externals.size());
        for (const auto& ext : inputs.externals) {
            ext.series.validate();
            if (ext.series.empty()) rep.empty_sources.push_back(ext.series.name());
            if (ext.transforms.empty()) {
                externals.push_back(adapter.align(ext.series, ext.policy));
            } else {
                externals.push_back(adapter.align(apply_source_transforms(ext.series, ext.transforms),
                                                  ext.policy));
            }
        }

        auto frame = PriceFrame::from_block(prices.name(), price_block);

        std::vector<FeatureBlock> features;
        features.push_back(TechnicalIndicatorGenerator(config_.indicators).generate(frame, timeline, &warmup));
        features.push_back(LagRollingFeatureGenerator(config_.lag_rolling).generate(frame, timeline, &warmup));
        if (config_.calendar_features) {
            features.push_back(CalendarFeatureGenerator().generate(timeline, &warmup));
        }
        if (config_.market_proxies) {
            features.push_back(MarketProxyFeatureGenerator(config_.proxy_window).generate(frame, timeline, &warmup));
        }
        if (!config_.macro_spreads.empty()) {
            std::vector<const FeatureBlock*> sources;
            for (const auto& b : externals) sources.push_back(&b);
            auto macro = MacroSpreadGenerator(config_.macro_spreads).generate(sources, timeline);
            if (macro.column_count() > 0) features.push_back(std::move(macro));
        }

        std::vector<const FeatureBlock*> blocks;
        blocks.push_back(&price_block);
        for (const auto& b : externals) blocks.push_back(&b);
        for (const auto& b : features) blocks.push_back(&b);
        if (cross.column_count() > 0) blocks.push_back(&cross);

        FusionGuard guard(timeline, config_.fusion);
        auto matrix = guard.fuse(prices.name(), blocks, &rep);
        matrix.warmup_rows = std::min(warmup.max_warmup(), matrix.rows());
        rep.warmup_rows = matrix.warmup_rows;
        if (warmup_out) *warmup_out = warmup;
        return matrix;
    }

    // Batch over every price series in `inputs`.
    std::vector<InstrumentResult> run(const EngineInputs& inputs) const {
        auto timeline = build_timeline(inputs);
        WarmupTracker cross_warmup;
        auto cross = build_cross_block(inputs, timeline, &cross_warmup);

        std::vector<InstrumentResult> results(inputs.prices.size());
        std::atomic<size_t> next{0};
        auto worker = [&]() {
            for (size_t i = next++; i < results.size(); i = next++) {
                run_one(inputs.prices[i], inputs, timeline, cross, cross_warmup, results[i]);
            }
        };

        size_t threads = std::min(config_.num_workers, results.size());
        if (threads <= 1) {
            worker();
        } else {
            std::vector<std::thread> pool;
            pool.reserve(threads);
            for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
            for (auto& t : pool) t.join();
        }
        return results;
    }

private:
    EngineConfig config_;
    std::ostream* log_;
    mutable std::mutex log_mutex_;

    void run_one(const TimeSeries& prices, const EngineInputs& inputs,
                 const CanonicalTimeline& timeline, const FeatureBlock& cross,
                 const WarmupTracker& cross_warmup, InstrumentResult& out) const {
        out.instrument = prices.name();
        try {
            out.matrix = fuse_instrument(prices, inputs, timeline, cross, cross_warmup,
                                         &out.report, &out.warmup);
            out.ok = true;
        } catch (const std::exception& e) {
            out.ok = false;
            out.error = e.what();
            log("FAILED " + out.instrument + ": " + out.error);
            return;
        }

        for (const auto& src : out.report.empty_sources) {
            log("WARN " + out.instrument + ": source '" + src + "' has no observations");
        }
        if (!out.report.sparse_columns.empty()) {
            std::string names;
            for (const auto& c : out.report.sparse_columns) names += (names.empty() ? "" : ", ") + c;
            log("WARN " + out.instrument + ": " + std::to_string(out.report.sparse_columns.size()) +
                " columns more than " + std::to_string(config_.fusion.max_undefined_fraction) +
                " undefined before fill: " + names);
        }
    }

    void log(const std::string& line) const {
        if (!log_) return;
        std::lock_guard<std::mutex> lock(log_mutex_);
        *log_ << line << "\n";
    }
};
