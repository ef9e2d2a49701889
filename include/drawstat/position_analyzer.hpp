#pragma once

/// @file include/drawstat/position_analyzer.hpp
/// @brief Per-(position, value) gap statistics.
///
/// # Module: Position Analyzer
///
/// ## Responsibility
/// For every value in a position's range, walk the snapshot chronologically
/// and derive appearance counts, the gap ("skip") history between
/// appearances, average/min/max gap, hot/cold classification and a trend over
/// recent gaps. Also summarises the pooled skips of a position and tracks the
/// same gap statistics for categorical value classes (even, prime, ...).
///
/// ## Guarantees
/// - Always returns a complete map over the position's range
/// - Gaps are non-negative; `current_gap ≤ total_draws`
/// - `is_hot` and `is_cold` are never both true
/// - Deterministic and side-effect free
///
/// ## NOT Responsible For
/// - Caching (the Engine memoises results)
/// - Scoring (see scoring.hpp)

#include "drawstat/constants.hpp"
#include "drawstat/snapshot.hpp"
#include "drawstat/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace drawstat::analysis {

// ─── AnalyzerConfig ───────────────────────────────────────────────────────────

struct AnalyzerConfig {
    std::size_t hot_min         = constants::HOT_GAP_MIN;
    double      hot_fraction    = constants::HOT_GAP_FRACTION;
    std::size_t cold_min        = constants::COLD_GAP_MIN;
    double      cold_fraction   = constants::COLD_GAP_FRACTION;
    std::size_t trend_window    = constants::TREND_WINDOW;
    double      trend_threshold = constants::TREND_THRESHOLD;

    /// max(hot_min, ⌊hot_fraction · total_draws⌋)
    [[nodiscard]] std::size_t hot_threshold(std::size_t total_draws) const noexcept;

    /// max(cold_min, ⌊cold_fraction · total_draws⌋)
    [[nodiscard]] std::size_t cold_threshold(std::size_t total_draws) const noexcept;
};

// ─── PositionStat ─────────────────────────────────────────────────────────────

/// Gap statistics of one value at one position.
struct PositionStat {
    std::size_t                position          = 0;
    Value                      value             = 0;
    std::size_t                total_appearances = 0;
    std::size_t                current_gap       = 0;  ///< Draws since last appearance
    double                     average_gap       = 0.0;
    std::size_t                max_gap           = 0;
    std::size_t                min_gap           = 0;
    std::optional<std::size_t> last_seen_index;        ///< nullopt if never seen
    std::vector<std::size_t>   skip_history;           ///< Chronological gap lengths
    bool                       is_hot            = false;
    bool                       is_cold           = false;
    Trend                      trend             = Trend::Stable;

    /// The value has been absent longer than its average gap.
    [[nodiscard]] bool is_due() const noexcept {
        return average_gap > 0.0 && static_cast<double>(current_gap) > average_gap;
    }

    bool operator==(const PositionStat&) const = default;
};

using PositionStatMap = std::map<Value, PositionStat>;

// ─── PositionSummary ──────────────────────────────────────────────────────────

/// Descriptive statistics of every skip recorded at one position, pooled over
/// all values of its range.
struct PositionSummary {
    std::size_t position             = 0;
    std::size_t total_draws          = 0;
    std::size_t unique_values        = 0;  ///< Distinct values actually drawn
    Value       most_frequent_value  = 0;  ///< Ties: smaller value
    Value       least_frequent_value = 0;  ///< Among drawn values; ties: smaller value
    double      mean_skip            = 0.0;
    double      median_skip          = 0.0;
    double      mode_skip            = 0.0;
    double      variance             = 0.0;  ///< Sample variance (n − 1)
    double      std_dev              = 0.0;
    std::size_t min_skip             = 0;
    std::size_t max_skip             = 0;
    std::size_t range                = 0;

    bool operator==(const PositionSummary&) const = default;
};

// ─── Pattern categories ───────────────────────────────────────────────────────

enum class PatternCategory {
    Even,
    Odd,
    High,      ///< value > midpoint of the position's range
    Low,
    Prime,
    NonPrime,
    LastDigit0,
    LastDigit1,
    LastDigit2,
    LastDigit3,
    LastDigit4,
    LastDigit5,
    LastDigit6,
    LastDigit7,
    LastDigit8,
    LastDigit9,
};

inline constexpr std::size_t PATTERN_CATEGORY_COUNT = 16;

[[nodiscard]] std::string to_string(PatternCategory c);

/// True if `value` belongs to `category` for a position ranging over `range`.
[[nodiscard]] bool matches(PatternCategory category, Value value,
                           const ValueRange& range) noexcept;

[[nodiscard]] bool is_prime(Value v) noexcept;

/// Gap statistics where an "occurrence" is any draw whose value at the
/// position belongs to the category.
struct PatternStat {
    std::size_t              position          = 0;
    PatternCategory          category          = PatternCategory::Even;
    std::size_t              total_appearances = 0;
    std::size_t              current_gap       = 0;
    double                   average_gap       = 0.0;
    std::size_t              max_gap           = 0;
    std::size_t              min_gap           = 0;
    std::vector<std::size_t> skip_history;
    bool                     is_hot            = false;
    bool                     is_cold           = false;
    Trend                    trend             = Trend::Stable;

    bool operator==(const PatternStat&) const = default;
};

// ─── PositionAnalyzer ─────────────────────────────────────────────────────────

class PositionAnalyzer {
public:
    explicit PositionAnalyzer(AnalyzerConfig config = AnalyzerConfig{}) noexcept
        : config_(config) {}

    /// Stats for every value in the position's range.
    /// Empty map when `position` is outside the layout.
    [[nodiscard]] PositionStatMap analyze(const Snapshot& snapshot,
                                          std::size_t position) const;

    /// Stats for a single value. `nullopt` when the position or value is out
    /// of range.
    [[nodiscard]] std::optional<PositionStat>
    analyze_value(const Snapshot& snapshot, std::size_t position, Value value) const;

    /// `nullopt` when `position` is outside the layout.
    [[nodiscard]] std::optional<PositionSummary>
    summarize(const Snapshot& snapshot, std::size_t position) const;

    /// One entry per PatternCategory, in declaration order.
    /// Empty when `position` is outside the layout.
    [[nodiscard]] std::vector<PatternStat>
    analyze_patterns(const Snapshot& snapshot, std::size_t position) const;

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

private:
    AnalyzerConfig config_;
};

}  // namespace drawstat::analysis
