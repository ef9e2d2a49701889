#pragma once

/// @file include/drawstat/correlation.hpp
/// @brief Pairwise Pearson correlation between positions.
///
/// # Module: Cross-Position Correlator
///
/// ## Responsibility
/// Measure how the value sequences of two positions move together across the
/// snapshot, classify the strength and attach a significance figure.
///
/// ## Guarantees
/// - `correlate(a, b)` equals `correlate(b, a)` up to the position labels
/// - Degenerate input (fewer than 3 draws, zero variance, |r| = 1) never
///   produces NaN: strength is weak and significance 0
/// - `correlation_matrix` is symmetric with a unit diagonal
///
/// ## Significance
/// `1 − p` where p is the two-tailed Student-t p-value of
/// `t = r·√((n − 2) / (1 − r²))` with n − 2 degrees of freedom.

#include "drawstat/cancellation.hpp"
#include "drawstat/snapshot.hpp"
#include "drawstat/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace drawstat::analysis {

struct Correlation {
    std::size_t         position_a   = 0;
    std::size_t         position_b   = 0;
    double              coefficient  = 0.0;  ///< Pearson r ∈ [−1, 1]
    CorrelationStrength strength     = CorrelationStrength::Weak;
    double              significance = 0.0;  ///< 1 − p ∈ [0, 1]
    std::size_t         sample_size  = 0;

    bool operator==(const Correlation&) const = default;
};

class CrossPositionCorrelator {
public:
    /// Correlation between positions `a` and `b`. Out-of-layout positions
    /// yield a zero, weak correlation with sample size 0.
    [[nodiscard]] static Correlation correlate(const Snapshot& snapshot,
                                               std::size_t a, std::size_t b);

    /// Every unordered pair (a < b) once, ordered by (a, b). The token is
    /// polled once per row `a`; a cancelled token throws CancelledError.
    [[nodiscard]] static std::vector<Correlation>
    correlate_all(const Snapshot& snapshot, const CancellationToken* token = nullptr);

    /// N×N matrix of coefficients (diagonal 1, undefined pairs 0).
    [[nodiscard]] static Eigen::MatrixXd correlation_matrix(const Snapshot& snapshot);

    [[nodiscard]] static CorrelationStrength classify(double r) noexcept;
};

}  // namespace drawstat::analysis
