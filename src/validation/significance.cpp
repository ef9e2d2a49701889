/// @file src/validation/significance.cpp
/// @brief Significance tests over a cross-validation report.

#include "drawstat/validation.hpp"

#include <algorithm>
#include <cmath>

namespace drawstat::validation {

SignificanceReport
PredictionValidator::significance_tests(const CrossValidationReport& report) const {
    SignificanceReport out;
    out.stability = report.stability;

    std::vector<double> accuracies;
    accuracies.reserve(report.folds.size());
    double baseline_sum = 0.0;
    std::size_t valid = 0;
    for (const auto& f : report.folds) {
        accuracies.push_back(f.result.accuracy);
        if (f.result.is_valid) {
            baseline_sum += f.result.baseline;
            ++valid;
        }
    }
    out.baseline = valid > 0 ? baseline_sum / static_cast<double>(valid) : random_baseline(1);

    // ── Mean accuracy vs baseline ─────────────────────────────────────────────
    out.accuracy_test        = stats::one_sample_t_test(accuracies, out.baseline);
    out.accuracy_significant = out.accuracy_test.p_value < config_.alpha;

    auto ci = stats::mean_confidence_interval(accuracies, config_.confidence_level);
    ci.lower = std::clamp(ci.lower, 0.0, 1.0);
    ci.upper = std::clamp(ci.upper, 0.0, 1.0);
    out.accuracy_interval = ci;

    // ── Per-bucket hit rates (chi-square, 1 dof) ──────────────────────────────
    const std::size_t n = snapshot_->positions();
    double comparisons = 0.0;
    std::vector<double> hits(n, 0.0);
    std::vector<double> expected_hits(n, 0.0);
    for (const auto& f : report.folds) {
        const auto total = static_cast<double>(f.result.total_comparisons);
        comparisons += total;
        for (std::size_t k = 0; k < std::min(n, f.result.hit_rates.size()); ++k) {
            hits[k] += f.result.hit_rates[k] * total;
        }
        for (std::size_t k = 0; k < std::min(n, f.result.expected_hit_rates.size()); ++k) {
            expected_hits[k] += f.result.expected_hit_rates[k] * total;
        }
    }

    out.buckets.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
        BucketSignificance b;
        b.min_matches   = k + 1;
        // Random-draw odds depend on the predicted values in box mode, so
        // the folds record them; an empty report falls back to straight odds.
        b.expected_rate = comparisons > 0.0 ? expected_hits[k] / comparisons
                                            : random_baseline(k + 1);
        if (comparisons > 0.0) {
            b.observed_rate = hits[k] / comparisons;
            const double expected = b.expected_rate * comparisons;
            if (expected > 0.0) {
                const double diff = std::round(hits[k]) - expected;
                b.chi_square = diff * diff / expected;
                b.p_value    = stats::chi_square_upper_p(b.chi_square, 1.0);
            }
        }
        b.is_significant = b.p_value < config_.alpha;
        out.buckets.push_back(b);
    }
    return out;
}

}  // namespace drawstat::validation
