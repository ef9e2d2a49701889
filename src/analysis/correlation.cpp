/// @file src/analysis/correlation.cpp
/// @brief CrossPositionCorrelator implementation.

#include "drawstat/correlation.hpp"
#include "drawstat/constants.hpp"
#include "drawstat/statistics.hpp"

#include <cmath>

namespace drawstat::analysis {

namespace {

/// Column p of the snapshot as doubles.
Eigen::VectorXd column(const Snapshot& snapshot, std::size_t p) {
    Eigen::VectorXd out(static_cast<Eigen::Index>(snapshot.size()));
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = static_cast<double>(snapshot.value_at(i, p));
    }
    return out;
}

std::span<const double> as_span(const Eigen::VectorXd& v) noexcept {
    return {v.data(), static_cast<std::size_t>(v.size())};
}

}  // namespace

CorrelationStrength CrossPositionCorrelator::classify(double r) noexcept {
    const double a = std::abs(r);
    if (a < constants::CORRELATION_MODERATE) return CorrelationStrength::Weak;
    if (a < constants::CORRELATION_STRONG)   return CorrelationStrength::Moderate;
    return CorrelationStrength::Strong;
}

// ─── correlate ────────────────────────────────────────────────────────────────

Correlation CrossPositionCorrelator::correlate(const Snapshot& snapshot,
                                               std::size_t a, std::size_t b) {
    Correlation c{.position_a = a, .position_b = b};
    if (a >= snapshot.positions() || b >= snapshot.positions()) return c;

    const std::size_t n = snapshot.size();
    c.sample_size = n;
    if (n < constants::MIN_CORRELATION_SAMPLES) return c;

    const auto xa = column(snapshot, a);
    const auto xb = column(snapshot, b);
    const auto r = stats::pearson(as_span(xa), as_span(xb));
    if (!r) return c;  // zero variance

    c.coefficient = *r;
    c.strength    = classify(*r);

    const double one_minus_r2 = 1.0 - (*r) * (*r);
    if (one_minus_r2 <= 0.0) return c;  // |r| = 1: t undefined

    const double dof = static_cast<double>(n - 2);
    const double t   = (*r) * std::sqrt(dof / one_minus_r2);
    c.significance   = 1.0 - stats::two_tailed_t_p(t, dof);
    return c;
}

// ─── correlate_all ────────────────────────────────────────────────────────────

std::vector<Correlation>
CrossPositionCorrelator::correlate_all(const Snapshot& snapshot,
                                       const CancellationToken* token) {
    const std::size_t n = snapshot.positions();
    std::vector<Correlation> out;
    if (n >= 2) out.reserve(n * (n - 1) / 2);

    for (std::size_t a = 0; a < n; ++a) {
        if (token) token->throw_if_cancelled();
        for (std::size_t b = a + 1; b < n; ++b) {
            out.push_back(correlate(snapshot, a, b));
        }
    }
    return out;
}

// ─── correlation_matrix ───────────────────────────────────────────────────────

Eigen::MatrixXd CrossPositionCorrelator::correlation_matrix(const Snapshot& snapshot) {
    const auto n = static_cast<Eigen::Index>(snapshot.positions());
    Eigen::MatrixXd m = Eigen::MatrixXd::Identity(n, n);
    if (snapshot.size() < constants::MIN_CORRELATION_SAMPLES) return m;

    std::vector<Eigen::VectorXd> cols;
    cols.reserve(static_cast<std::size_t>(n));
    for (Eigen::Index p = 0; p < n; ++p) {
        cols.push_back(column(snapshot, static_cast<std::size_t>(p)));
    }

    for (Eigen::Index a = 0; a < n; ++a) {
        for (Eigen::Index b = a + 1; b < n; ++b) {
            const auto r = stats::pearson(as_span(cols[static_cast<std::size_t>(a)]),
                                          as_span(cols[static_cast<std::size_t>(b)]));
            const double v = r.value_or(0.0);
            m(a, b) = v;
            m(b, a) = v;
        }
    }
    return m;
}

}  // namespace drawstat::analysis
