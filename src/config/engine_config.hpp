#pragma once

#include "alignment/alignment_adapter.hpp"
#include "features/cross_series_features.hpp"
#include "features/lag_rolling_features.hpp"
#include "features/macro_spreads.hpp"
#include "features/market_proxy_features.hpp"
#include "features/source_transforms.hpp"
#include "fusion/fusion_guard.hpp"
#include "indicators/indicator_catalog.hpp"
#include "series/granularity.hpp"
#include "time_utils.hpp"
#include "timeline/canonical_timeline.hpp"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ExternalSourceSpec — one non-price input (macro, sentiment, cross-asset)
// ---------------------------------------------------------------------------
struct ExternalSourceSpec {
    std::string name;
    std::string path;
    Granularity granularity = Granularity::DAY;
    uint64_t publication_lag_ns = 0;
    std::vector<SourceTransform> transforms;
};

// ---------------------------------------------------------------------------
// EngineConfig — everything one run of the engine needs
// ---------------------------------------------------------------------------
struct EngineConfig {
    TimelineRequest timeline;
    IndicatorParams indicators;
    LagRollingConfig lag_rolling;
    CrossSeriesConfig cross_series;
    FusionConfig fusion;
    std::vector<MacroSpread> macro_spreads = default_macro_spreads();
    size_t proxy_window = MarketProxyFeatureGenerator::DEFAULT_WINDOW;
    bool calendar_features = true;
    bool market_proxies = true;
    size_t num_workers = 1;

    void validate() const {
        if (timeline.end_ts < timeline.start_ts) {
            throw std::invalid_argument("Analysis window end precedes start");
        }
        if (num_workers == 0) throw std::invalid_argument("num_workers must be >= 1");
        if (proxy_window == 0) throw std::invalid_argument("proxy_window must be > 0");
        indicators.validate();
        lag_rolling.validate();
        cross_series.validate();
        fusion.validate();
    }
};

// ---------------------------------------------------------------------------
// config_parse — list parsers for the command-line surface
// ---------------------------------------------------------------------------
namespace config_parse {

inline std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string item;
    std::istringstream ss(text);
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

inline size_t parse_size(const std::string& text) {
    size_t pos = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Not a non-negative integer: '" + text + "'");
    }
    if (pos != text.size() || text[0] == '-') {
        throw std::invalid_argument("Not a non-negative integer: '" + text + "'");
    }
    return static_cast<size_t>(v);
}

// "1,2,24" -> {1, 2, 24}
inline std::vector<size_t> parse_int_list(const std::string& text) {
    std::vector<size_t> out;
    for (const auto& item : split(text, ',')) out.push_back(parse_size(item));
    return out;
}

// "USD_JPY:EUR_USD,EUR_USD:GBP_USD"
inline std::vector<std::pair<std::string, std::string>> parse_pairs(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& item : split(text, ',')) {
        auto legs = split(item, ':');
        if (legs.size() != 2) {
            throw std::invalid_argument("Expected A:B pair, got '" + item + "'");
        }
        out.emplace_back(legs[0], legs[1]);
    }
    return out;
}

// "12:26,5:10"
inline std::vector<std::pair<size_t, size_t>> parse_span_pairs(const std::string& text) {
    std::vector<std::pair<size_t, size_t>> out;
    for (const auto& [a, b] : parse_pairs(text)) {
        out.emplace_back(parse_size(a), parse_size(b));
    }
    return out;
}

// "name=path[:granularity[:lag_hours]]"
inline ExternalSourceSpec parse_external(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
        throw std::invalid_argument("Expected name=path[:granularity[:lag_hours]], got '" + text + "'");
    }
    ExternalSourceSpec spec;
    spec.name = text.substr(0, eq);
    auto fields = split(text.substr(eq + 1), ':');
    if (fields.empty() || fields.size() > 3) {
        throw std::invalid_argument("Malformed external source '" + text + "'");
    }
    spec.path = fields[0];
    if (fields.size() >= 2) spec.granularity = parse_granularity(fields[1]);
    if (fields.size() == 3) {
        spec.publication_lag_ns = static_cast<uint64_t>(parse_size(fields[2])) * time_utils::NS_PER_HOUR;
    }
    return spec;
}

// Transforms for one external source, keyed by the source name:
//   "macro:us_cpi_yoy=pct_change:us_cpi:12:100"  one transform
//   "macro:@macro"                               CPI YoY / unemployment change preset
//   "crypto:@market:btc"                         btc_return / btc_volatility preset
inline std::pair<std::string, std::vector<SourceTransform>> parse_transform(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        throw std::invalid_argument("Expected source:output=kind:column[:periods[:scale]], got '" +
                                    text + "'");
    }
    std::string source = text.substr(0, colon);
    std::string rest = text.substr(colon + 1);

    std::vector<SourceTransform> out;
    if (rest[0] == '@') {
        auto fields = split(rest.substr(1), ':');
        if (fields.size() == 1 && fields[0] == "macro") {
            out = macro_source_transforms();
        } else if (fields.size() == 2 && fields[0] == "market") {
            out = market_source_transforms(fields[1]);
        } else {
            throw std::invalid_argument("Unknown transform preset in '" + text +
                                        "' (expected @macro or @market:<name>)");
        }
        return {source, out};
    }

    auto eq = rest.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument("Expected output=kind:column[:periods[:scale]] in '" + text + "'");
    }
    auto fields = split(rest.substr(eq + 1), ':');
    if (fields.size() < 2 || fields.size() > 4) {
        throw std::invalid_argument("Malformed transform '" + text + "'");
    }
    SourceTransform t;
    t.output = rest.substr(0, eq);
    t.kind = parse_source_transform_kind(fields[0]);
    t.column = fields[1];
    if (fields.size() >= 3) t.periods = parse_size(fields[2]);
    if (fields.size() == 4) {
        size_t pos = 0;
        try {
            t.scale = std::stod(fields[3], &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos != fields[3].size()) {
            throw std::invalid_argument("Not a number: '" + fields[3] + "' in '" + text + "'");
        }
    }
    t.validate();
    out.push_back(t);
    return {source, out};
}

// Timestamp argument; throws on anything parse_timestamp rejects.
inline uint64_t parse_time_arg(const std::string& text) {
    auto ts = time_utils::parse_timestamp(text);
    if (!ts) throw std::invalid_argument("Unrecognised timestamp: '" + text + "'");
    return *ts;
}

}  // namespace config_parse
