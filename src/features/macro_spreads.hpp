#pragma once

#include "indicators/rolling.hpp"
#include "series/feature_block.hpp"
#include "timeline/canonical_timeline.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// MacroSpread — `name` = minuend - subtrahend, both aligned external columns
// ---------------------------------------------------------------------------
struct MacroSpread {
    std::string name;
    std::string minuend;
    std::string subtrahend;
};

inline std::vector<MacroSpread> default_macro_spreads() {
    return {
        {"yield_curve", "us_10y_treasury", "us_2y_treasury"},
        {"us_jp_rate_diff", "us_fed_funds_rate", "jp_long_term_rate"},
    };
}

// ---------------------------------------------------------------------------
// MacroSpreadGenerator — differences between aligned external columns.
// Spreads whose legs are absent from every source block are skipped.
// ---------------------------------------------------------------------------
class MacroSpreadGenerator {
public:
    explicit MacroSpreadGenerator(std::vector<MacroSpread> spreads = default_macro_spreads())
        : spreads_(std::move(spreads)) {
        for (const auto& s : spreads_) {
            if (s.name.empty() || s.minuend.empty() || s.subtrahend.empty()) {
                throw std::invalid_argument("Macro spread needs a name and two columns");
            }
        }
    }

    const std::vector<MacroSpread>& spreads() const { return spreads_; }

    FeatureBlock generate(const std::vector<const FeatureBlock*>& sources,
                          const CanonicalTimeline& timeline) const {
        FeatureBlock block("macro", timeline);
        for (const auto& spread : spreads_) {
            const auto* a = find(sources, spread.minuend);
            const auto* b = find(sources, spread.subtrahend);
            if (!a || !b) continue;
            rolling::Series out(timeline.size(), rolling::UNDEFINED);
            for (size_t i = 0; i < out.size(); ++i) out[i] = (*a)[i] - (*b)[i];
            block.add(spread.name, std::move(out));
        }
        return block;
    }

private:
    std::vector<MacroSpread> spreads_;

    static const rolling::Series* find(const std::vector<const FeatureBlock*>& sources,
                                       const std::string& column) {
        for (const auto* src : sources) {
            if (src->has_column(column)) return &src->column(column);
        }
        return nullptr;
    }
};
