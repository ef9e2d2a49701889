/// @file src/validation/statistics.cpp
/// @brief Statistics kernels over Boost.Math distributions.

#include "drawstat/statistics.hpp"

#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

namespace drawstat::stats {

namespace {

constexpr double MIN_LEVEL = 1e-9;
constexpr double MAX_LEVEL = 1.0 - 1e-9;

double clamp_p(double p) noexcept {
    if (!std::isfinite(p)) return 1.0;
    return std::clamp(p, 0.0, 1.0);
}

}  // namespace

// ─── Descriptive ──────────────────────────────────────────────────────────────

double mean(std::span<const double> xs) noexcept {
    if (xs.empty()) return 0.0;
    return std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
}

double population_variance(std::span<const double> xs) noexcept {
    if (xs.empty()) return 0.0;
    const double m = mean(xs);
    double ss = 0.0;
    for (double x : xs) ss += (x - m) * (x - m);
    return ss / static_cast<double>(xs.size());
}

double sample_variance(std::span<const double> xs) noexcept {
    if (xs.size() < 2) return 0.0;
    const double m = mean(xs);
    double ss = 0.0;
    for (double x : xs) ss += (x - m) * (x - m);
    return ss / static_cast<double>(xs.size() - 1);
}

double median(std::span<const double> xs) {
    if (xs.empty()) return 0.0;
    std::vector<double> sorted(xs.begin(), xs.end());
    std::sort(sorted.begin(), sorted.end());
    const std::size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1) return sorted[mid];
    return 0.5 * (sorted[mid - 1] + sorted[mid]);
}

double mode(std::span<const double> xs) {
    if (xs.empty()) return 0.0;
    std::map<double, std::size_t> counts;
    for (double x : xs) ++counts[x];
    // std::map iterates ascending, so the first maximum is the smallest value
    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it->second > best->second) best = it;
    }
    return best->first;
}

std::optional<double> pearson(std::span<const double> x,
                              std::span<const double> y) noexcept {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;

    const double mx = mean(x);
    const double my = mean(y);
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;

    const double r = sxy / std::sqrt(sxx * syy);
    if (!std::isfinite(r)) return std::nullopt;
    return std::clamp(r, -1.0, 1.0);
}

double lag1_autocorrelation(std::span<const double> xs) noexcept {
    if (xs.size() < 2) return 0.0;
    const double var = population_variance(xs);
    if (var <= 0.0) return 0.0;

    const double m = mean(xs);
    double acc = 0.0;
    for (std::size_t i = 1; i < xs.size(); ++i) {
        acc += (xs[i] - m) * (xs[i - 1] - m);
    }
    return acc / (static_cast<double>(xs.size() - 1) * var);
}

double volatility(std::span<const double> xs) noexcept {
    if (xs.size() < 2) return 0.0;
    double ss = 0.0;
    for (std::size_t i = 1; i < xs.size(); ++i) {
        const double d = xs[i] - xs[i - 1];
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(xs.size() - 1));
}

// ─── Distributions ────────────────────────────────────────────────────────────

double normal_cdf(double x) {
    if (std::isnan(x)) return 0.5;
    if (std::isinf(x)) return x > 0 ? 1.0 : 0.0;
    return boost::math::cdf(boost::math::normal{}, x);
}

double two_tailed_normal_p(double z) {
    if (std::isnan(z)) return 1.0;
    if (std::isinf(z)) return 0.0;
    return clamp_p(2.0 * boost::math::cdf(boost::math::complement(
                             boost::math::normal{}, std::abs(z))));
}

double normal_critical(double level) {
    const double l = std::clamp(level, MIN_LEVEL, MAX_LEVEL);
    return boost::math::quantile(boost::math::normal{}, 0.5 + l / 2.0);
}

double two_tailed_t_p(double t, double dof) {
    if (!(dof >= 1.0) || std::isnan(t)) return 1.0;
    if (std::isinf(t)) return 0.0;
    const boost::math::students_t dist{dof};
    return clamp_p(2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(t))));
}

double chi_square_upper_p(double statistic, double dof) {
    if (!(statistic > 0.0) || !(dof > 0.0)) return 1.0;
    if (std::isinf(statistic)) return 0.0;
    const boost::math::chi_squared dist{dof};
    return clamp_p(boost::math::cdf(boost::math::complement(dist, statistic)));
}

double probability_at_least(std::span<const double> ps, std::size_t k) {
    if (k == 0) return 1.0;
    if (k > ps.size()) return 0.0;

    // dist[j] = P(exactly j successes among the first i trials)
    std::vector<double> dist(ps.size() + 1, 0.0);
    dist[0] = 1.0;
    for (std::size_t i = 0; i < ps.size(); ++i) {
        const double p = std::clamp(ps[i], 0.0, 1.0);
        for (std::size_t j = i + 1; j > 0; --j) {
            dist[j] = dist[j] * (1.0 - p) + dist[j - 1] * p;
        }
        dist[0] *= (1.0 - p);
    }
    double tail = 0.0;
    for (std::size_t j = k; j < dist.size(); ++j) tail += dist[j];
    return std::clamp(tail, 0.0, 1.0);
}

// ─── Intervals ────────────────────────────────────────────────────────────────

Interval wilson_interval(std::size_t successes, std::size_t trials, double level) {
    if (trials == 0) return {};

    const double n = static_cast<double>(trials);
    const double p = static_cast<double>(std::min(successes, trials)) / n;
    const double z = normal_critical(level);
    const double z2 = z * z;

    const double denom  = 1.0 + z2 / n;
    const double center = (p + z2 / (2.0 * n)) / denom;
    const double spread = z * std::sqrt(p * (1.0 - p) / n + z2 / (4.0 * n * n)) / denom;

    // Rounding can push a bound past p at the extremes.
    return Interval{
        .lower = std::clamp(center - spread, 0.0, p),
        .upper = std::clamp(center + spread, p, 1.0),
    };
}

MeanInterval mean_confidence_interval(std::span<const double> xs, double level) {
    MeanInterval out;
    out.mean  = mean(xs);
    out.lower = out.mean;
    out.upper = out.mean;
    if (xs.size() < 2) return out;

    const double n  = static_cast<double>(xs.size());
    const double se = std::sqrt(sample_variance(xs) / n);
    const double l  = std::clamp(level, MIN_LEVEL, MAX_LEVEL);
    const boost::math::students_t dist{n - 1.0};
    const double t_crit = boost::math::quantile(dist, 0.5 + l / 2.0);

    out.lower = out.mean - t_crit * se;
    out.upper = out.mean + t_crit * se;
    return out;
}

// ─── Tests ────────────────────────────────────────────────────────────────────

ZTest binomial_z_test(std::size_t successes, std::size_t trials, double p0) {
    if (trials == 0) return {};

    const double n = static_cast<double>(trials);
    const double p = static_cast<double>(successes) / n;
    const double se = std::sqrt(p0 * (1.0 - p0) / n);
    if (!(se > 0.0)) {
        return p == p0 ? ZTest{} : ZTest{.z = 0.0, .p_value = 0.0};
    }
    const double z = (p - p0) / se;
    return ZTest{.z = z, .p_value = two_tailed_normal_p(z)};
}

ZTest two_proportion_z_test(double p1, std::size_t n1, double p2, std::size_t n2) {
    if (n1 == 0 || n2 == 0) return {};
    const double se = std::sqrt(p1 * (1.0 - p1) / static_cast<double>(n1) +
                                p2 * (1.0 - p2) / static_cast<double>(n2));
    if (!(se > 0.0)) return {};
    const double z = (p1 - p2) / se;
    return ZTest{.z = z, .p_value = two_tailed_normal_p(z)};
}

TTest one_sample_t_test(std::span<const double> xs, double mu0) {
    TTest out;
    if (xs.size() < 2) return out;

    out.dof = static_cast<double>(xs.size() - 1);
    const double sd = std::sqrt(sample_variance(xs));
    if (!(sd > 0.0)) return out;

    const double diff = mean(xs) - mu0;
    out.t        = diff / (sd / std::sqrt(static_cast<double>(xs.size())));
    out.p_value  = two_tailed_t_p(out.t, out.dof);
    out.cohens_d = diff / sd;
    return out;
}

double mann_kendall_p(std::span<const double> xs) {
    const std::size_t n = xs.size();
    if (n < 3) return 1.0;

    long long s = 0;
    for (std::size_t i = 0; i + 1 < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            if (xs[j] > xs[i]) ++s;
            else if (xs[j] < xs[i]) --s;
        }
    }
    const double nd = static_cast<double>(n);
    const double var_s = nd * (nd - 1.0) * (2.0 * nd + 5.0) / 18.0;
    return two_tailed_normal_p(static_cast<double>(s) / std::sqrt(var_s));
}

std::vector<double> to_doubles(std::span<const std::size_t> xs) {
    std::vector<double> out;
    out.reserve(xs.size());
    for (auto x : xs) out.push_back(static_cast<double>(x));
    return out;
}

}  // namespace drawstat::stats
