#pragma once

/// @file include/drawstat/scoring.hpp
/// @brief Composite scoring of candidate values and combinations.
///
/// # Module: Composite Scoring Engine
///
/// ## Responsibility
/// Combine five signals into one score in [0, 1]:
///
/// | Component   | Scope       | Definition                                        |
/// |-------------|-------------|---------------------------------------------------|
/// | due         | position    | clamp((gap − avgGap) / avgGap, 0, 1)              |
/// | hot/cold    | position    | 1 if hot, 0.3 if cold and overdue, else 0         |
/// | transition  | position    | P(value ∣ latest value at the position)           |
/// | parity      | combination | 1 − (∣evens − N/2∣ − (N mod 2)/2) / ⌊N/2⌋ (N=1: 1) |
/// | correlation | combination | 1 − mean penalty over position pairs              |
///
/// Position components are averaged over positions. A pair (a, b) is
/// penalised by ∣r∣ when r < 0 and both chosen values sit on the same side of
/// their position means.
///
/// ## Guarantees
/// - `total` is a pure function of (snapshot, combination, weights): no
///   hidden randomness, fixed summation order
/// - Every component and the total lie in [0, 1]
/// - Wrong arity or out-of-range values throw InvalidCombinationError
///
/// ## NOT Responsible For
/// - Claiming predictive power; see validation.hpp for that question

#include "drawstat/constants.hpp"
#include "drawstat/position_analyzer.hpp"
#include "drawstat/snapshot.hpp"
#include "drawstat/transition.hpp"
#include "drawstat/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <vector>

namespace drawstat::scoring {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Non-negative component weights. Need not sum to 1; see normalized().
struct ScoringWeights {
    double due         = 0.30;
    double parity      = 0.10;
    double hot_cold    = 0.20;
    double transition  = 0.25;
    double correlation = 0.15;

    /// Negative entries clamp to 0; the rest are scaled to sum to 1.
    /// An all-zero (or non-finite) set becomes equal weights.
    [[nodiscard]] ScoringWeights normalized() const noexcept;

    bool operator==(const ScoringWeights&) const = default;
};

struct ScoringConfig {
    ScoringWeights weights{};

    /// Combination search requires at least this many draws.
    std::size_t min_draws_for_combinations = constants::MIN_COMBINATION_DRAWS;

    /// Values kept per position before the Cartesian product.
    std::size_t beam_width = constants::DEFAULT_BEAM_WIDTH;

    double cold_due_bonus   = constants::COLD_DUE_BONUS;
    double signal_threshold = constants::SIGNAL_THRESHOLD;
};

// ─── Results ──────────────────────────────────────────────────────────────────

struct CandidateScore {
    Combination combination;
    double      due         = 0.0;
    double      parity      = 0.0;
    double      hot_cold    = 0.0;
    double      transition  = 0.0;
    double      correlation = 0.0;
    double      total       = 0.0;
    double      confidence  = 0.0;  ///< matching signals / possible signals

    bool operator==(const CandidateScore&) const = default;
};

/// Historical box/straight hits of one combination.
struct BoxStraightHits {
    std::size_t                window             = 0;  ///< Draws inspected
    std::size_t                straight_hits      = 0;  ///< Exact positional match
    std::size_t                box_hits           = 0;  ///< Same multiset, any order
    double                     straight_frequency = 0.0;
    double                     box_frequency      = 0.0;
    std::optional<std::size_t> draws_since_straight;
    std::optional<std::size_t> draws_since_box;
};

// ─── ScoringContext ───────────────────────────────────────────────────────────

/// Everything the scorer reads from a snapshot, computed once.
struct ScoringContext {
    DrawLayout                               layout;
    std::size_t                              total_draws = 0;
    std::vector<analysis::PositionStatMap>   stats;        ///< Per position
    std::vector<transition::TransitionTable> transitions;  ///< Per position
    Eigen::MatrixXd                          correlations;
    std::vector<double>                      position_means;
    std::vector<std::optional<Value>>        last_values;  ///< Latest draw

    [[nodiscard]] static ScoringContext
    build(const Snapshot& snapshot,
          const analysis::PositionAnalyzer& analyzer = analysis::PositionAnalyzer{});
};

// ─── CombinationScorer ────────────────────────────────────────────────────────

class CombinationScorer {
public:
    explicit CombinationScorer(ScoringConfig config = ScoringConfig{}) noexcept
        : config_(config) {}

    /// Score a full combination. Throws InvalidCombinationError.
    [[nodiscard]] CandidateScore score(const ScoringContext& ctx,
                                       const Combination& combination) const;

    [[nodiscard]] CandidateScore score(const Snapshot& snapshot,
                                       const Combination& combination) const;

    /// Score one candidate value at one position. Parity is 1 when the
    /// value's parity is the latest draw's minority parity (or the draw is
    /// balanced), else 0.5; correlation is 1. Throws InvalidCombinationError
    /// on an out-of-range position or value.
    [[nodiscard]] CandidateScore score_value(const ScoringContext& ctx,
                                             std::size_t position, Value value) const;

    /// Beam search: the `beam_width` best values per position by
    /// score_value, Cartesian product, best `limit` by total desc then
    /// combination asc. Empty below `min_draws_for_combinations`.
    [[nodiscard]] std::vector<CandidateScore>
    top_combinations(const ScoringContext& ctx, std::size_t limit) const;

    /// Like top_combinations but each position only offers overdue values
    /// (current gap above average gap), ranked by due component. Empty when
    /// some position has no overdue value.
    [[nodiscard]] std::vector<CandidateScore>
    due_combinations(const ScoringContext& ctx, std::size_t limit) const;

    /// Hits of `combination` within the last `window` draws.
    /// Throws InvalidCombinationError.
    [[nodiscard]] static BoxStraightHits
    box_straight_hits(const Snapshot& snapshot, const Combination& combination,
                      std::size_t window = constants::BOX_STRAIGHT_WINDOW);

    /// Throws InvalidCombinationError when `combination` does not fit `layout`.
    static void validate(const DrawLayout& layout, const Combination& combination);

    [[nodiscard]] const ScoringConfig& config() const noexcept { return config_; }

private:
    struct PositionComponents {
        double due        = 0.0;
        double hot_cold   = 0.0;
        double transition = 0.0;
    };

    [[nodiscard]] PositionComponents
    position_components(const ScoringContext& ctx, std::size_t position, Value value) const;

    /// Enumerate the product of `candidates`, score, rank and truncate.
    [[nodiscard]] std::vector<CandidateScore>
    rank_product(const ScoringContext& ctx,
                 const std::vector<std::vector<Value>>& candidates,
                 std::size_t limit) const;

    ScoringConfig config_;
};

}  // namespace drawstat::scoring
