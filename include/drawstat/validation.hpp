#pragma once

/// @file include/drawstat/validation.hpp
/// @brief Cross-validation and significance testing of prediction functions.
///
/// # Module: Validation & Significance Engine
///
/// ## Responsibility
/// Given a caller-supplied prediction function, measure how often its
/// predictions meet their own expected-hit thresholds on held-out draws and
/// whether that rate beats the random baseline.
///
/// ## Fold layout
/// For n draws and k folds, foldSize = ⌊n / k⌋. Fold i tests
/// `[i·foldSize, (i+1)·foldSize)`; the last fold runs to n. Training data is
/// every other draw in chronological order.
///
/// ## Guarantees
/// - Exactly k folds, assembled in fold order even when run concurrently
/// - A throwing prediction function marks only its fold invalid
/// - Empty predictions are a validity failure, never an exception
/// - Cancellation is observed between folds only; in parallel mode it stops
///   folds that have not been launched yet, and at most `max_parallel_folds`
///   are ever in flight
///
/// ## NOT Responsible For
/// - Generating predictions (the caller supplies `PredictFn`)

#include "drawstat/cancellation.hpp"
#include "drawstat/constants.hpp"
#include "drawstat/snapshot.hpp"
#include "drawstat/statistics.hpp"
#include "drawstat/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace drawstat::validation {

// ─── Inputs ───────────────────────────────────────────────────────────────────

struct Prediction {
    Combination combination;
    double      confidence    = 0.0;
    std::size_t expected_hits = 1;  ///< Matches needed to count as correct (≥ 1)
};

/// (training snapshot, number of held-out draws) → predictions.
using PredictFn = std::function<std::vector<Prediction>(const Snapshot&, std::size_t)>;

struct ValidationConfig {
    double      confidence_level   = constants::DEFAULT_CONFIDENCE_LEVEL;
    double      alpha              = constants::SIGNIFICANCE_ALPHA;
    MatchMode   match_mode         = MatchMode::Straight;
    bool        parallel_folds     = false;  ///< Run folds with std::async
    std::size_t max_parallel_folds = constants::MAX_PARALLEL_FOLDS;  ///< In-flight cap
};

// ─── Results ──────────────────────────────────────────────────────────────────

struct ValidationResult {
    bool        is_valid            = false;
    std::string error;
    double      accuracy            = 0.0;
    double      confidence          = 0.0;
    std::size_t total_comparisons   = 0;  ///< predictions × actual draws
    std::size_t correct_comparisons = 0;

    /// hit_rates[k − 1] = share of comparisons with at least k matches.
    std::vector<double> hit_rates;
    /// expected_hit_rates[k − 1] = the same share for uniformly random draws.
    std::vector<double> expected_hit_rates;

    stats::Interval confidence_interval{};
    double          p_value        = 1.0;
    bool            is_significant = false;
    double          baseline       = 0.0;  ///< Random-chance accuracy

    bool operator==(const ValidationResult&) const = default;
};

struct FoldResult {
    std::size_t      index      = 0;
    std::size_t      test_begin = 0;  ///< First held-out draw index
    std::size_t      test_end   = 0;  ///< One past the last held-out draw
    std::size_t      train_size = 0;
    ValidationResult result;
};

struct TemporalStability {
    double autocorrelation = 0.0;  ///< Lag-1 over fold accuracies
    double trend_p_value   = 1.0;  ///< Mann-Kendall, two-tailed
    double volatility      = 0.0;  ///< RMS of successive differences
};

struct CrossValidationReport {
    std::vector<FoldResult>    folds;
    double                     mean_accuracy      = 0.0;
    double                     std_dev_accuracy   = 0.0;  ///< Population
    double                     overall_confidence = 0.0;  ///< Mean over valid folds
    std::optional<std::size_t> best_fold;   ///< Valid folds only; ties: lowest index
    std::optional<std::size_t> worst_fold;
    TemporalStability          stability;
};

enum class ABWinner { None, A, B };

struct ABTestResult {
    ValidationResult a;
    ValidationResult b;
    double           z              = 0.0;
    double           p_value        = 1.0;
    bool             is_significant = false;
    ABWinner         winner         = ABWinner::None;
    double           confidence     = 0.0;  ///< 1 − p when a winner exists
};

struct BucketSignificance {
    std::size_t min_matches   = 0;
    double      observed_rate = 0.0;
    double      expected_rate = 0.0;
    double      chi_square    = 0.0;
    double      p_value       = 1.0;
    bool        is_significant = false;
};

struct SignificanceReport {
    stats::TTest                    accuracy_test;      ///< vs mean baseline
    bool                            accuracy_significant = false;
    double                          baseline             = 0.0;
    stats::MeanInterval             accuracy_interval;  ///< Clamped to [0, 1]
    std::vector<BucketSignificance> buckets;
    TemporalStability               stability;
};

// ─── PredictionValidator ──────────────────────────────────────────────────────

class PredictionValidator {
public:
    explicit PredictionValidator(SnapshotPtr snapshot,
                                 ValidationConfig config = ValidationConfig{});

    /// k-fold cross-validation over the whole snapshot.
    ///
    /// # Errors
    /// - `std::invalid_argument` when k = 0
    /// - `InsufficientDataError` when the snapshot has fewer than 2k draws
    /// - `CancelledError` when `token` is cancelled before a fold is launched
    [[nodiscard]] CrossValidationReport
    cross_validate(const PredictFn& predict, std::size_t k,
                   const CancellationToken* token = nullptr,
                   const ProgressFn& progress = {}) const;

    /// Score predictions against actual draws.
    [[nodiscard]] ValidationResult validate(std::span<const Prediction> predictions,
                                            std::span<const Draw> actual) const;

    /// Train both predictors on the snapshot minus `test_draws` (matched by
    /// date) and compare their accuracies with a two-proportion z-test.
    [[nodiscard]] ABTestResult ab_test(const PredictFn& a, const PredictFn& b,
                                       std::span<const Draw> test_draws) const;

    /// t-test, per-bucket chi-square and temporal stability over the folds
    /// of a cross-validation report.
    [[nodiscard]] SignificanceReport
    significance_tests(const CrossValidationReport& report) const;

    /// Matches between a prediction and one draw under `mode`.
    [[nodiscard]] static std::size_t count_matches(std::span<const Value> predicted,
                                                   std::span<const Value> actual,
                                                   MatchMode mode);

    /// P(a uniformly random draw has ≥ k matches with `combination` under the
    /// configured match mode). Straight odds do not depend on the values;
    /// box odds do, and without a combination the straight odds are used.
    [[nodiscard]] double random_baseline(std::size_t k,
                                         std::span<const Value> combination = {}) const;

    /// random_baseline(k, combination) for every k in [0, positions].
    [[nodiscard]] std::vector<double>
    random_baseline_tail(std::span<const Value> combination = {}) const;

    [[nodiscard]] const ValidationConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] FoldResult run_fold(const PredictFn& predict, std::size_t index,
                                      std::size_t begin, std::size_t end) const;

    [[nodiscard]] ValidationResult failed(std::string error) const;

    SnapshotPtr      snapshot_;
    ValidationConfig config_;
};

// ─── Report ───────────────────────────────────────────────────────────────────

/// Plain-text report of a cross-validation run with recommendations.
[[nodiscard]] std::string render_report(const CrossValidationReport& report,
                                        const SignificanceReport& significance);

/// Recommendation lines derived from a significance report.
[[nodiscard]] std::vector<std::string>
recommendations(const SignificanceReport& significance);

}  // namespace drawstat::validation
