/// @file src/analysis/position_analyzer.cpp
/// @brief PositionAnalyzer: per-value stats and position summaries.

#include "drawstat/position_analyzer.hpp"
#include "drawstat/statistics.hpp"

#include "gap_series.hpp"

#include <algorithm>
#include <cmath>

namespace drawstat::analysis {

namespace {

/// Occurrence indices of every value in `range`, indexed by value − range.min.
std::vector<std::vector<std::size_t>>
collect_indices(const Snapshot& snapshot, std::size_t position, const ValueRange& range) {
    std::vector<std::vector<std::size_t>> by_value(range.size());
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
        const Value v = snapshot.value_at(i, position);
        by_value[static_cast<std::size_t>(v - range.min)].push_back(i);
    }
    return by_value;
}

PositionStat to_stat(std::size_t position, Value value, detail::GapSeries&& g) {
    PositionStat s;
    s.position          = position;
    s.value             = value;
    s.total_appearances = g.occurrences;
    s.current_gap       = g.current_gap;
    s.average_gap       = g.average_gap;
    s.max_gap           = g.max_gap;
    s.min_gap           = g.min_gap;
    s.last_seen_index   = g.last_index;
    s.skip_history      = std::move(g.gaps);
    s.is_hot            = g.is_hot;
    s.is_cold           = g.is_cold;
    s.trend             = g.trend;
    return s;
}

}  // namespace

// ─── PositionAnalyzer::analyze ────────────────────────────────────────────────

PositionStatMap PositionAnalyzer::analyze(const Snapshot& snapshot,
                                          std::size_t position) const {
    PositionStatMap out;
    if (position >= snapshot.positions()) return out;

    const ValueRange range = snapshot.layout().ranges[position];
    auto by_value = collect_indices(snapshot, position, range);

    for (Value v = range.min; v <= range.max; ++v) {
        auto& idx = by_value[static_cast<std::size_t>(v - range.min)];
        out.emplace(v, to_stat(position, v, detail::compute_gaps(idx, snapshot.size(), config_)));
    }
    return out;
}

std::optional<PositionStat>
PositionAnalyzer::analyze_value(const Snapshot& snapshot, std::size_t position,
                                Value value) const {
    if (position >= snapshot.positions()) return std::nullopt;
    if (!snapshot.layout().ranges[position].contains(value)) return std::nullopt;

    std::vector<std::size_t> idx;
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
        if (snapshot.value_at(i, position) == value) idx.push_back(i);
    }
    return to_stat(position, value, detail::compute_gaps(idx, snapshot.size(), config_));
}

// ─── PositionAnalyzer::summarize ──────────────────────────────────────────────

std::optional<PositionSummary>
PositionAnalyzer::summarize(const Snapshot& snapshot, std::size_t position) const {
    if (position >= snapshot.positions()) return std::nullopt;

    const auto per_value = analyze(snapshot, position);

    PositionSummary s;
    s.position    = position;
    s.total_draws = snapshot.size();

    std::vector<double> skips;
    const PositionStat* most  = nullptr;
    const PositionStat* least = nullptr;

    // std::map iterates ascending, so strict comparisons keep the smaller
    // value on ties.
    for (const auto& [value, stat] : per_value) {
        for (auto g : stat.skip_history) skips.push_back(static_cast<double>(g));
        if (stat.total_appearances == 0) continue;
        ++s.unique_values;
        if (!most || stat.total_appearances > most->total_appearances) most = &stat;
        if (!least || stat.total_appearances < least->total_appearances) least = &stat;
    }
    if (most)  s.most_frequent_value  = most->value;
    if (least) s.least_frequent_value = least->value;

    if (!skips.empty()) {
        const auto [mn, mx] = std::minmax_element(skips.begin(), skips.end());
        s.min_skip    = static_cast<std::size_t>(*mn);
        s.max_skip    = static_cast<std::size_t>(*mx);
        s.range       = s.max_skip - s.min_skip;
        s.mean_skip   = stats::mean(skips);
        s.median_skip = stats::median(skips);
        s.mode_skip   = stats::mode(skips);
        s.variance    = stats::sample_variance(skips);
        s.std_dev     = std::sqrt(s.variance);
    }
    return s;
}

}  // namespace drawstat::analysis
