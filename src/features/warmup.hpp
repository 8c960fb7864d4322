#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>

// ---------------------------------------------------------------------------
// WarmupTracker — declared warm-up length per derived column. A row is in
// warm-up while any declared column is still necessarily undefined there.
// ---------------------------------------------------------------------------
class WarmupTracker {
public:
    WarmupTracker() = default;

    void declare(const std::string& column, size_t warmup) {
        warmups_[column] = warmup;
        max_warmup_ = std::max(max_warmup_, warmup);
    }

    // Absorb another tracker's declarations.
    void merge(const WarmupTracker& other) {
        for (const auto& [column, warmup] : other.warmups_) declare(column, warmup);
    }

    bool has(const std::string& column) const { return warmups_.count(column) > 0; }

    size_t warmup_of(const std::string& column) const {
        auto it = warmups_.find(column);
        return it == warmups_.end() ? 0 : it->second;
    }

    size_t max_warmup() const { return max_warmup_; }

    bool is_warmup(size_t row) const { return row < max_warmup_; }

    const std::map<std::string, size_t>& declared() const { return warmups_; }

private:
    std::map<std::string, size_t> warmups_;
    size_t max_warmup_ = 0;
};
