#pragma once

/// @file include/drawstat/statistics.hpp
/// @brief Descriptive statistics and hypothesis tests.
///
/// # Module: Statistics
///
/// ## Responsibility
/// Small numeric kernels shared by the analyzer, correlator and validator:
/// moments, order statistics, Pearson correlation, Wilson intervals, and
/// z / t / chi-square / Mann-Kendall tests. Distribution functions come from
/// Boost.Math.
///
/// ## Guarantees
/// - Degenerate input (empty, zero variance, zero trials) yields documented
///   neutral values, never NaN
/// - p-values are in [0, 1]

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace drawstat::stats {

// ─── Descriptive ──────────────────────────────────────────────────────────────

/// Arithmetic mean; 0 for empty input.
[[nodiscard]] double mean(std::span<const double> xs) noexcept;

/// Population variance (divide by n); 0 for empty input.
[[nodiscard]] double population_variance(std::span<const double> xs) noexcept;

/// Sample variance (divide by n − 1); 0 for fewer than two values.
[[nodiscard]] double sample_variance(std::span<const double> xs) noexcept;

/// Median; 0 for empty input.
[[nodiscard]] double median(std::span<const double> xs);

/// Most frequent value; ties resolve to the smallest. 0 for empty input.
[[nodiscard]] double mode(std::span<const double> xs);

/// Pearson correlation. `nullopt` when fewer than two pairs, the spans differ
/// in length, or either side has zero variance.
[[nodiscard]] std::optional<double> pearson(std::span<const double> x,
                                            std::span<const double> y) noexcept;

/// Lag-1 autocorrelation Σ(xᵢ−x̄)(xᵢ₋₁−x̄) / ((n−1)·σ²) with population σ².
/// 0 when n < 2 or σ² = 0.
[[nodiscard]] double lag1_autocorrelation(std::span<const double> xs) noexcept;

/// Root-mean-square of successive differences; 0 when n < 2.
[[nodiscard]] double volatility(std::span<const double> xs) noexcept;

// ─── Distributions ────────────────────────────────────────────────────────────

/// Standard normal CDF Φ(x).
[[nodiscard]] double normal_cdf(double x);

/// Two-tailed standard normal p-value 2·(1 − Φ(|z|)).
[[nodiscard]] double two_tailed_normal_p(double z);

/// z such that P(|Z| ≤ z) = level. `level` is clamped into (0, 1).
[[nodiscard]] double normal_critical(double level);

/// Two-tailed Student-t p-value; 1 when dof < 1.
[[nodiscard]] double two_tailed_t_p(double t, double dof);

/// Upper-tail chi-square p-value P(X ≥ statistic); 1 when statistic ≤ 0.
[[nodiscard]] double chi_square_upper_p(double statistic, double dof);

/// P(X ≥ k) for a sum of independent Bernoulli(pᵢ) (Poisson-binomial).
[[nodiscard]] double probability_at_least(std::span<const double> ps, std::size_t k);

// ─── Intervals ────────────────────────────────────────────────────────────────

struct Interval {
    double lower = 0.0;
    double upper = 0.0;

    bool operator==(const Interval&) const = default;
};

/// Wilson-score interval for successes / trials at `level` (e.g. 0.95).
/// Always 0 ≤ lower ≤ successes/trials ≤ upper ≤ 1; {0, 0} for zero trials.
[[nodiscard]] Interval wilson_interval(std::size_t successes, std::size_t trials,
                                       double level);

struct MeanInterval {
    double mean  = 0.0;
    double lower = 0.0;
    double upper = 0.0;
};

/// Student-t interval for the mean at `level`. Collapses to the mean when
/// fewer than two values are supplied.
[[nodiscard]] MeanInterval mean_confidence_interval(std::span<const double> xs,
                                                    double level);

// ─── Tests ────────────────────────────────────────────────────────────────────

struct ZTest {
    double z       = 0.0;
    double p_value = 1.0;
};

/// Normal-approximation binomial test of successes / trials against p0.
/// Zero trials ⇒ {0, 1}. A degenerate p0 (0 or 1) gives p = 1 when the
/// observed rate equals p0, else p = 0.
[[nodiscard]] ZTest binomial_z_test(std::size_t successes, std::size_t trials, double p0);

/// Two-proportion z-test with unpooled standard error
/// √(p₁(1−p₁)/n₁ + p₂(1−p₂)/n₂). Zero trials or zero SE ⇒ {0, 1}.
[[nodiscard]] ZTest two_proportion_z_test(double p1, std::size_t n1,
                                          double p2, std::size_t n2);

struct TTest {
    double t         = 0.0;
    double dof       = 0.0;
    double p_value   = 1.0;
    double cohens_d  = 0.0;
};

/// One-sample t-test of mean(xs) against mu0 using the sample standard
/// deviation. Fewer than two values or zero deviation ⇒ neutral {0, n−1, 1, 0}.
[[nodiscard]] TTest one_sample_t_test(std::span<const double> xs, double mu0);

/// Mann-Kendall trend test, two-tailed p-value without tie correction.
/// 1 when n < 3.
[[nodiscard]] double mann_kendall_p(std::span<const double> xs);

/// Convert integer counts to doubles for the span-based kernels.
[[nodiscard]] std::vector<double> to_doubles(std::span<const std::size_t> xs);

}  // namespace drawstat::stats
