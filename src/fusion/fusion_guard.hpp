#pragma once

#include "fusion_error.hpp"
#include "indicators/rolling.hpp"
#include "series/feature_block.hpp"
#include "timeline/canonical_timeline.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

// ---------------------------------------------------------------------------
// FusionConfig
// ---------------------------------------------------------------------------
enum class FillPolicy {
    FORWARD,           // forward fill only; leading gaps stay undefined
    FORWARD_BACKWARD,  // forward fill, then back-fill leading gaps
};

inline FillPolicy parse_fill_policy(const std::string& text) {
    if (text == "forward" || text == "ffill") return FillPolicy::FORWARD;
    if (text == "forward_backward" || text == "ffill_bfill") return FillPolicy::FORWARD_BACKWARD;
    throw std::invalid_argument("Unknown fill policy: '" + text + "'");
}

struct FusionConfig {
    FillPolicy fill = FillPolicy::FORWARD_BACKWARD;
    double max_undefined_fraction = 0.5;

    void validate() const {
        if (!(max_undefined_fraction >= 0.0 && max_undefined_fraction <= 1.0)) {
            throw std::invalid_argument("max_undefined_fraction must be in [0, 1]");
        }
    }
};

// ---------------------------------------------------------------------------
// FusionReport — per-instrument diagnostics of one fusion pass
// ---------------------------------------------------------------------------
struct FusionReport {
    std::string instrument;
    size_t rows = 0;
    size_t columns = 0;
    std::vector<std::string> renamed;         // "original -> final"
    size_t inf_replaced = 0;
    size_t forward_filled = 0;
    size_t backward_filled = 0;
    std::vector<std::string> sparse_columns;  // pre-fill undefined fraction above threshold
    std::vector<std::string> empty_sources;
    size_t warmup_rows = 0;
};

// ---------------------------------------------------------------------------
// FusedMatrix — final per-instrument matrix on the canonical timeline.
// Column names are globally unique.
// ---------------------------------------------------------------------------
struct FusedMatrix {
    std::string instrument;
    std::vector<uint64_t> timestamps;
    std::vector<std::string> names;
    std::vector<std::vector<double>> columns;
    size_t warmup_rows = 0;

    size_t rows() const { return timestamps.size(); }
    size_t column_count() const { return names.size(); }

    bool has_column(const std::string& name) const {
        for (const auto& n : names) {
            if (n == name) return true;
        }
        return false;
    }

    const std::vector<double>& column(const std::string& name) const {
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name) return columns[i];
        }
        throw std::out_of_range("Matrix '" + instrument + "' has no column '" + name + "'");
    }
};

// ---------------------------------------------------------------------------
// FusionGuard — joins blocks onto the timeline and runs the single fill pass.
//
// Order per column: +-inf -> undefined, forward fill, then (FORWARD_BACKWARD)
// back-fill of the leading gap. After forward fill the only gap left is the
// leading one, so the backward step never writes into the interior.
// ---------------------------------------------------------------------------
class FusionGuard {
public:
    FusionGuard(const CanonicalTimeline& timeline, const FusionConfig& config)
        : timeline_(timeline), config_(config) {
        config_.validate();
    }

    FusedMatrix fuse(const std::string& instrument, const std::vector<const FeatureBlock*>& blocks,
                     FusionReport* report = nullptr) const {
        FusionReport local;
        FusionReport& rep = report ? *report : local;
        rep.instrument = instrument;

        FusedMatrix m;
        m.instrument = instrument;
        m.timestamps = timeline_.timestamps();

        std::unordered_set<std::string> taken;
        for (const auto* block : blocks) {
            block->check_compatible(timeline_);
            const auto& names = block->column_names();
            const auto& cols = block->columns();
            for (size_t c = 0; c < names.size(); ++c) {
                std::string name = unique_name(names[c], block->name(), taken);
                if (name != names[c]) rep.renamed.push_back(names[c] + " -> " + name);
                taken.insert(name);
                m.names.push_back(name);
                m.columns.push_back(cols[c]);
            }
        }

        const size_t rows = m.rows();
        for (size_t c = 0; c < m.columns.size(); ++c) {
            auto& col = m.columns[c];
            rep.inf_replaced += replace_infinities(col);
            size_t undefined = count_undefined(col);
            if (rows > 0 &&
                static_cast<double>(undefined) / static_cast<double>(rows) > config_.max_undefined_fraction) {
                rep.sparse_columns.push_back(m.names[c]);
            }
            rep.forward_filled += forward_fill(col);
            if (config_.fill == FillPolicy::FORWARD_BACKWARD) {
                rep.backward_filled += backward_fill_leading(col);
            }
        }

        rep.rows = rows;
        rep.columns = m.column_count();
        return m;
    }

    // Returns the number of infinities converted to undefined.
    static size_t replace_infinities(std::vector<double>& col) {
        size_t n = 0;
        for (auto& v : col) {
            if (std::isinf(v)) {
                v = rolling::UNDEFINED;
                ++n;
            }
        }
        return n;
    }

    // Returns the number of cells written.
    static size_t forward_fill(std::vector<double>& col) {
        size_t filled = 0;
        size_t start = rolling::leading_undefined(col);
        for (size_t i = start + 1; i < col.size(); ++i) {
            if (!rolling::is_defined(col[i])) {
                col[i] = col[i - 1];
                ++filled;
            }
        }
        return filled;
    }

    // Copies the first defined value into the leading gap only.
    static size_t backward_fill_leading(std::vector<double>& col) {
        size_t lead = rolling::leading_undefined(col);
        if (lead == 0 || lead == col.size()) return 0;
        for (size_t i = 0; i < lead; ++i) col[i] = col[lead];
        return lead;
    }

    static size_t count_undefined(const std::vector<double>& col) {
        size_t n = 0;
        for (double v : col) {
            if (!rolling::is_defined(v)) ++n;
        }
        return n;
    }

private:
    const CanonicalTimeline& timeline_;
    FusionConfig config_;

    // name, else name_{block}, else name_{block}_2, _3, ...
    static std::string unique_name(const std::string& name, const std::string& block,
                                   const std::unordered_set<std::string>& taken) {
        if (!taken.count(name)) return name;
        std::string candidate = name + "_" + block;
        for (int k = 2; taken.count(candidate); ++k) {
            candidate = name + "_" + block + "_" + std::to_string(k);
        }
        return candidate;
    }
};
