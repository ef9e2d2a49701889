/// @file src/scoring/combination_scorer.cpp
/// @brief ScoringContext and per-combination / per-value scoring.

#include "drawstat/scoring.hpp"
#include "drawstat/correlation.hpp"
#include "drawstat/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace drawstat::scoring {

namespace {

double clamp01(double x) noexcept {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

bool is_even(Value v) noexcept { return v % 2 == 0; }

}  // namespace

// ─── ScoringWeights ───────────────────────────────────────────────────────────

ScoringWeights ScoringWeights::normalized() const noexcept {
    const auto pos = [](double w) { return std::isfinite(w) && w > 0.0 ? w : 0.0; };
    ScoringWeights w{
        .due         = pos(due),
        .parity      = pos(parity),
        .hot_cold    = pos(hot_cold),
        .transition  = pos(transition),
        .correlation = pos(correlation),
    };
    const double sum = w.due + w.parity + w.hot_cold + w.transition + w.correlation;
    if (!(sum > 0.0) || !std::isfinite(sum)) {
        return ScoringWeights{0.2, 0.2, 0.2, 0.2, 0.2};
    }
    w.due         /= sum;
    w.parity      /= sum;
    w.hot_cold    /= sum;
    w.transition  /= sum;
    w.correlation /= sum;
    return w;
}

// ─── ScoringContext ───────────────────────────────────────────────────────────

ScoringContext ScoringContext::build(const Snapshot& snapshot,
                                     const analysis::PositionAnalyzer& analyzer) {
    ScoringContext ctx;
    ctx.layout      = snapshot.layout();
    ctx.total_draws = snapshot.size();

    const std::size_t n = snapshot.positions();
    ctx.stats.reserve(n);
    ctx.transitions.reserve(n);
    ctx.position_means.reserve(n);
    ctx.last_values.reserve(n);

    for (std::size_t p = 0; p < n; ++p) {
        ctx.stats.push_back(analyzer.analyze(snapshot, p));
        ctx.transitions.push_back(transition::TransitionModel::build(snapshot, p));

        double sum = 0.0;
        for (std::size_t i = 0; i < snapshot.size(); ++i) sum += snapshot.value_at(i, p);
        ctx.position_means.push_back(snapshot.empty() ? 0.0
                                                      : sum / static_cast<double>(snapshot.size()));

        ctx.last_values.push_back(snapshot.empty()
                                      ? std::nullopt
                                      : std::optional<Value>{snapshot.value_at(snapshot.size() - 1, p)});
    }
    ctx.correlations = analysis::CrossPositionCorrelator::correlation_matrix(snapshot);
    return ctx;
}

// ─── validate ─────────────────────────────────────────────────────────────────

void CombinationScorer::validate(const DrawLayout& layout, const Combination& combination) {
    if (layout.positions() == 0) {
        throw InvalidCombinationError("layout has no positions");
    }
    if (combination.size() != layout.positions()) {
        throw InvalidCombinationError(fmt::format(
            "combination has {} values, layout expects {}",
            combination.size(), layout.positions()));
    }
    for (std::size_t p = 0; p < combination.size(); ++p) {
        const auto& r = layout.ranges[p];
        if (!r.contains(combination[p])) {
            throw InvalidCombinationError(fmt::format(
                "value {} at position {} outside [{}, {}]",
                combination[p], p, r.min, r.max));
        }
    }
}

// ─── position_components ──────────────────────────────────────────────────────

CombinationScorer::PositionComponents
CombinationScorer::position_components(const ScoringContext& ctx, std::size_t position,
                                       Value value) const {
    PositionComponents c;

    const auto& by_value = ctx.stats[position];
    const auto it = by_value.find(value);
    if (it != by_value.end()) {
        const auto& s = it->second;
        const double gap = static_cast<double>(s.current_gap);
        if (s.average_gap > 0.0) {
            c.due = clamp01((gap - s.average_gap) / s.average_gap);
        }
        if (s.is_hot) {
            c.hot_cold = 1.0;
        } else if (s.is_cold && s.is_due()) {
            c.hot_cold = config_.cold_due_bonus;
        }
    }

    if (const auto& last = ctx.last_values[position]) {
        c.transition = clamp01(
            transition::TransitionModel::probability(ctx.transitions[position], *last, value));
    }
    return c;
}

// ─── score ────────────────────────────────────────────────────────────────────

CandidateScore CombinationScorer::score(const ScoringContext& ctx,
                                        const Combination& combination) const {
    validate(ctx.layout, combination);

    const std::size_t n = combination.size();
    const double nd = static_cast<double>(n);
    const double threshold = config_.signal_threshold;

    CandidateScore out;
    out.combination = combination;

    std::size_t matching = 0;
    std::size_t evens = 0;
    for (std::size_t p = 0; p < n; ++p) {
        const auto c = position_components(ctx, p, combination[p]);
        out.due        += c.due;
        out.hot_cold   += c.hot_cold;
        out.transition += c.transition;
        matching += (c.due > threshold) + (c.hot_cold > threshold) + (c.transition > threshold);
        if (is_even(combination[p])) ++evens;
    }
    out.due        /= nd;
    out.hot_cold   /= nd;
    out.transition /= nd;

    // Distance from the most even split reachable with n values; an odd n
    // can be at best half a value off the midpoint.
    const double half  = nd / 2.0;
    const double slack = (n % 2 == 1) ? 0.5 : 0.0;
    const double spread = static_cast<double>(n / 2);
    out.parity = spread > 0.0
        ? clamp01(1.0 - (std::abs(static_cast<double>(evens) - half) - slack) / spread)
        : 1.0;

    out.correlation = 1.0;
    if (n >= 2 && ctx.correlations.rows() == static_cast<Eigen::Index>(n)) {
        double penalty = 0.0;
        std::size_t pairs = 0;
        for (std::size_t a = 0; a < n; ++a) {
            for (std::size_t b = a + 1; b < n; ++b) {
                ++pairs;
                const double r = ctx.correlations(static_cast<Eigen::Index>(a),
                                                  static_cast<Eigen::Index>(b));
                if (r >= 0.0) continue;
                const double da = combination[a] - ctx.position_means[a];
                const double db = combination[b] - ctx.position_means[b];
                if ((da > 0.0 && db > 0.0) || (da < 0.0 && db < 0.0)) penalty += std::abs(r);
            }
        }
        out.correlation = clamp01(1.0 - penalty / static_cast<double>(pairs));
    }

    matching += (out.parity >= threshold) + (out.correlation >= threshold);

    const auto w = config_.weights.normalized();
    out.total = clamp01(w.due * out.due + w.parity * out.parity + w.hot_cold * out.hot_cold +
                        w.transition * out.transition + w.correlation * out.correlation);
    out.confidence = std::min(1.0, static_cast<double>(matching) / (3.0 * nd + 2.0));
    return out;
}

CandidateScore CombinationScorer::score(const Snapshot& snapshot,
                                        const Combination& combination) const {
    validate(snapshot.layout(), combination);
    return score(ScoringContext::build(snapshot), combination);
}

// ─── score_value ──────────────────────────────────────────────────────────────

CandidateScore CombinationScorer::score_value(const ScoringContext& ctx,
                                              std::size_t position, Value value) const {
    if (position >= ctx.layout.positions()) {
        throw InvalidCombinationError(fmt::format(
            "position {} outside a {}-position layout", position, ctx.layout.positions()));
    }
    const auto& r = ctx.layout.ranges[position];
    if (!r.contains(value)) {
        throw InvalidCombinationError(fmt::format(
            "value {} at position {} outside [{}, {}]", value, position, r.min, r.max));
    }

    const double threshold = config_.signal_threshold;
    const auto c = position_components(ctx, position, value);

    CandidateScore out;
    out.combination = {value};
    out.due         = c.due;
    out.hot_cold    = c.hot_cold;
    out.transition  = c.transition;
    out.correlation = 1.0;

    // Favour the parity the latest draw was short of.
    out.parity = 0.5;
    if (ctx.total_draws > 0) {
        std::size_t evens = 0;
        for (const auto& last : ctx.last_values) {
            if (last && is_even(*last)) ++evens;
        }
        const std::size_t odds = ctx.last_values.size() - evens;
        const bool even = is_even(value);
        if (evens == odds || (even && evens < odds) || (!even && odds < evens)) {
            out.parity = 1.0;
        }
    }

    const std::size_t matching = (c.due > threshold) + (c.hot_cold > threshold) +
                                 (c.transition > threshold) + (out.parity >= threshold) +
                                 (out.correlation >= threshold);

    const auto w = config_.weights.normalized();
    out.total = clamp01(w.due * out.due + w.parity * out.parity + w.hot_cold * out.hot_cold +
                        w.transition * out.transition + w.correlation * out.correlation);
    out.confidence = std::min(1.0, static_cast<double>(matching) / 5.0);
    return out;
}

// ─── box_straight_hits ────────────────────────────────────────────────────────

BoxStraightHits CombinationScorer::box_straight_hits(const Snapshot& snapshot,
                                                     const Combination& combination,
                                                     std::size_t window) {
    validate(snapshot.layout(), combination);

    BoxStraightHits out;
    const std::size_t n = snapshot.size();
    out.window = std::min(window, n);
    if (out.window == 0) return out;

    Combination sorted_combo = combination;
    std::sort(sorted_combo.begin(), sorted_combo.end());

    Combination sorted_draw;
    for (std::size_t i = n - out.window; i < n; ++i) {
        const auto& values = snapshot.draws()[i].values;
        const std::size_t since = n - 1 - i;

        if (values == combination) {
            ++out.straight_hits;
            out.draws_since_straight = since;
        }
        sorted_draw.assign(values.begin(), values.end());
        std::sort(sorted_draw.begin(), sorted_draw.end());
        if (sorted_draw == sorted_combo) {
            ++out.box_hits;
            out.draws_since_box = since;
        }
    }

    out.straight_frequency = static_cast<double>(out.straight_hits) / static_cast<double>(out.window);
    out.box_frequency      = static_cast<double>(out.box_hits) / static_cast<double>(out.window);
    return out;
}

}  // namespace drawstat::scoring
