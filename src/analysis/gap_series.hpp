#pragma once

/// @file src/analysis/gap_series.hpp
/// @brief Internal gap-history arithmetic shared by value and pattern stats.

#include "drawstat/position_analyzer.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace drawstat::analysis::detail {

/// Gap statistics for one occurrence sequence.
struct GapSeries {
    std::size_t                occurrences = 0;
    std::size_t                current_gap = 0;
    double                     average_gap = 0.0;
    std::size_t                max_gap     = 0;
    std::size_t                min_gap     = 0;
    std::optional<std::size_t> last_index;
    std::vector<std::size_t>   gaps;
    bool                       is_hot      = false;
    bool                       is_cold     = false;
    Trend                      trend       = Trend::Stable;
};

/// Build a gap series from ascending occurrence indices into a snapshot of
/// `total_draws` draws.
///
/// Gaps are successive index differences plus a trailing gap
/// `total_draws − 1 − last` when positive. With no occurrences every gap
/// figure equals `total_draws` and the history is `[total_draws]` (empty for
/// an empty snapshot).
[[nodiscard]] GapSeries compute_gaps(std::span<const std::size_t> indices,
                                     std::size_t total_draws,
                                     const AnalyzerConfig& config);

/// Compare the mean of the last `window` gaps with the `window` before them.
/// Fewer than 2·window gaps ⇒ Stable.
[[nodiscard]] Trend classify_trend(std::span<const std::size_t> gaps,
                                   const AnalyzerConfig& config) noexcept;

}  // namespace drawstat::analysis::detail
