/// @file src/analysis/gap_series.cpp
/// @brief Gap-history arithmetic.

#include "gap_series.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace drawstat::analysis {

// ─── AnalyzerConfig ───────────────────────────────────────────────────────────

std::size_t AnalyzerConfig::hot_threshold(std::size_t total_draws) const noexcept {
    const auto scaled = static_cast<std::size_t>(
        std::floor(hot_fraction * static_cast<double>(total_draws)));
    return std::max(hot_min, scaled);
}

std::size_t AnalyzerConfig::cold_threshold(std::size_t total_draws) const noexcept {
    const auto scaled = static_cast<std::size_t>(
        std::floor(cold_fraction * static_cast<double>(total_draws)));
    return std::max(cold_min, scaled);
}

namespace detail {

// ─── classify_trend ───────────────────────────────────────────────────────────

Trend classify_trend(std::span<const std::size_t> gaps,
                     const AnalyzerConfig& config) noexcept {
    const std::size_t w = config.trend_window;
    if (w == 0 || gaps.size() < 2 * w) return Trend::Stable;

    const auto recent = gaps.last(w);
    const auto older  = gaps.subspan(gaps.size() - 2 * w, w);

    const auto sum = [](std::span<const std::size_t> s) {
        return static_cast<double>(std::accumulate(s.begin(), s.end(), std::size_t{0}));
    };
    const double recent_avg = sum(recent) / static_cast<double>(w);
    const double older_avg  = sum(older)  / static_cast<double>(w);
    if (older_avg <= 0.0) return Trend::Stable;

    const double change = (recent_avg - older_avg) / older_avg;
    if (change >= config.trend_threshold)  return Trend::Increasing;
    if (change <= -config.trend_threshold) return Trend::Decreasing;
    return Trend::Stable;
}

// ─── compute_gaps ─────────────────────────────────────────────────────────────

GapSeries compute_gaps(std::span<const std::size_t> indices,
                       std::size_t total_draws,
                       const AnalyzerConfig& config) {
    GapSeries out;
    out.occurrences = indices.size();

    if (indices.empty()) {
        out.current_gap = total_draws;
        out.average_gap = static_cast<double>(total_draws);
        out.max_gap     = total_draws;
        out.min_gap     = total_draws;
        if (total_draws > 0) {
            out.gaps.push_back(total_draws);
            out.is_hot  = out.current_gap <= config.hot_threshold(total_draws);
            out.is_cold = !out.is_hot && out.current_gap >= config.cold_threshold(total_draws);
        }
        return out;
    }

    out.gaps.reserve(indices.size());
    for (std::size_t i = 1; i < indices.size(); ++i) {
        out.gaps.push_back(indices[i] - indices[i - 1]);
    }

    const std::size_t last = indices.back();
    out.last_index  = last;
    out.current_gap = total_draws - 1 - last;
    if (out.current_gap > 0) out.gaps.push_back(out.current_gap);

    if (out.gaps.empty()) {
        // A single appearance on the final draw.
        out.average_gap = static_cast<double>(total_draws);
        out.max_gap     = total_draws;
        out.min_gap     = total_draws;
    } else {
        const auto [mn, mx] = std::minmax_element(out.gaps.begin(), out.gaps.end());
        out.min_gap = *mn;
        out.max_gap = *mx;
        out.average_gap =
            static_cast<double>(std::accumulate(out.gaps.begin(), out.gaps.end(), std::size_t{0})) /
            static_cast<double>(out.gaps.size());
    }

    out.is_hot  = out.current_gap <= config.hot_threshold(total_draws);
    out.is_cold = !out.is_hot && out.current_gap >= config.cold_threshold(total_draws);
    out.trend   = classify_trend(out.gaps, config);
    return out;
}

}  // namespace detail
}  // namespace drawstat::analysis
