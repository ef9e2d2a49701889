#pragma once

/// @file include/drawstat/engine.hpp
/// @brief Analysis engine: the public entry point tying every module together.
///
/// # Module: Engine
///
/// ## Responsibility
/// Hold the current snapshot of a SequenceStore and answer analysis, scoring
/// and validation queries over it, memoising derived results in a
/// ResultCache keyed by the snapshot fingerprint.
///
/// ## Usage
/// ```cpp
/// auto table = DataLoader::load_csv("draws.csv", {0, 9});
/// InMemorySequenceStore store(table->layout, table->draws);
/// Engine engine(store);
/// for (const auto& c : engine.top_combinations(5))
///     fmt::print("{}\n", fmt::join(c.combination, "-"));
/// ```
///
/// ## Guarantees
/// - The snapshot only changes on `refresh()`; a new fingerprint means old
///   cache entries are never hit again
/// - All query methods are const and safe to call concurrently
/// - Analysis queries never throw on short histories; they return neutral
///   (empty or zero) results
///
/// ## NOT Responsible For
/// - Reading files (see DataLoader)
/// - Owning the SequenceStore (it must outlive the Engine)

#include "drawstat/cache.hpp"
#include "drawstat/cancellation.hpp"
#include "drawstat/correlation.hpp"
#include "drawstat/position_analyzer.hpp"
#include "drawstat/scoring.hpp"
#include "drawstat/snapshot.hpp"
#include "drawstat/transition.hpp"
#include "drawstat/validation.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace drawstat::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    analysis::AnalyzerConfig     analyzer{};
    scoring::ScoringConfig       scoring{};     ///< Includes the minimum draws for combinations
    cache::CacheConfig           cache{};
    validation::ValidationConfig validation{};

    /// Restricts the history taken from the store on each refresh.
    DrawFilter filter{};
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// Takes the initial snapshot from `store`.
    explicit Engine(const SequenceStore& store, EngineConfig config = EngineConfig{});

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    /// Re-read the store. Cached results for the previous snapshot become
    /// unreachable and age out of the cache.
    void refresh();

    [[nodiscard]] SnapshotPtr snapshot() const;

    // ── Position analysis ─────────────────────────────────────────────────────

    [[nodiscard]] analysis::PositionStatMap position_stats(std::size_t position) const;

    [[nodiscard]] std::optional<analysis::PositionSummary>
    position_summary(std::size_t position) const;

    [[nodiscard]] std::vector<analysis::PatternStat> pattern_stats(std::size_t position) const;

    // ── Transitions and correlations ──────────────────────────────────────────

    [[nodiscard]] transition::TransitionTable transition_table(std::size_t position) const;

    /// Up to `top_k` most likely successors of `value` at `position`.
    [[nodiscard]] std::vector<transition::RankedTransition>
    transitions(std::size_t position, Value value, std::size_t top_k) const;

    [[nodiscard]] std::vector<analysis::Correlation>
    correlations(const CancellationToken* token = nullptr) const;

    [[nodiscard]] Eigen::MatrixXd correlation_matrix() const;

    // ── Scoring ───────────────────────────────────────────────────────────────

    /// Throws InvalidCombinationError when `combination` does not fit the layout.
    [[nodiscard]] scoring::CandidateScore score_combination(const Combination& combination) const;

    /// Throws InvalidCombinationError on an out-of-range position or value.
    [[nodiscard]] scoring::CandidateScore score_value(std::size_t position, Value value) const;

    [[nodiscard]] std::vector<scoring::CandidateScore> top_combinations(std::size_t limit) const;

    [[nodiscard]] std::vector<scoring::CandidateScore> due_combinations(std::size_t limit) const;

    [[nodiscard]] scoring::BoxStraightHits
    box_straight_hits(const Combination& combination,
                      std::size_t window = constants::BOX_STRAIGHT_WINDOW) const;

    // ── Validation ────────────────────────────────────────────────────────────

    /// See PredictionValidator::cross_validate for the error contract.
    [[nodiscard]] validation::CrossValidationReport
    cross_validate(const validation::PredictFn& predict, std::size_t k,
                   const CancellationToken* token = nullptr,
                   const ProgressFn& progress = {}) const;

    [[nodiscard]] validation::ABTestResult
    ab_test(const validation::PredictFn& a, const validation::PredictFn& b,
            std::span<const Draw> test_draws) const;

    [[nodiscard]] validation::SignificanceReport
    significance_tests(const validation::CrossValidationReport& report) const;

    /// Predictor that proposes the best-scoring combination of the training
    /// snapshot, falling back to the best value per position when the
    /// training history is too short for combination search.
    [[nodiscard]] static validation::PredictFn
    due_score_predictor(scoring::ScoringConfig scoring = scoring::ScoringConfig{},
                        analysis::AnalyzerConfig analyzer = analysis::AnalyzerConfig{});

    // ── Cache management ──────────────────────────────────────────────────────

    [[nodiscard]] cache::CacheStats cache_stats() const;
    void clear_cache();
    cache::OptimizeResult optimize_cache();

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    struct State {
        SnapshotPtr                                    snapshot;
        std::shared_ptr<const scoring::ScoringContext> context;  ///< Built on first use
    };

    [[nodiscard]] State state() const;
    [[nodiscard]] std::shared_ptr<const scoring::ScoringContext> context(const SnapshotPtr& snap) const;

    [[nodiscard]] static cache::CacheKey key(const Snapshot& snapshot, std::string kind,
                                             const std::string& params);

    const SequenceStore&         store_;
    EngineConfig                 config_;
    analysis::PositionAnalyzer   analyzer_;
    scoring::CombinationScorer   scorer_;
    mutable cache::ResultCache   cache_;
    mutable State                state_;
    mutable std::mutex           mutex_;
};

}  // namespace drawstat::core
