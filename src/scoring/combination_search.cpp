/// @file src/scoring/combination_search.cpp
/// @brief Beam search over candidate combinations.

#include "drawstat/scoring.hpp"

#include <algorithm>

namespace drawstat::scoring {

namespace {

struct ValueRank {
    Value  value;
    double key;
};

/// Highest key first; smaller value on ties.
void sort_ranks(std::vector<ValueRank>& ranks) {
    std::sort(ranks.begin(), ranks.end(), [](const ValueRank& a, const ValueRank& b) {
        if (a.key != b.key) return a.key > b.key;
        return a.value < b.value;
    });
}

std::vector<Value> take_values(const std::vector<ValueRank>& ranks, std::size_t width) {
    std::vector<Value> out;
    const std::size_t k = std::min(width, ranks.size());
    out.reserve(k);
    for (std::size_t i = 0; i < k; ++i) out.push_back(ranks[i].value);
    return out;
}

}  // namespace

// ─── rank_product ─────────────────────────────────────────────────────────────

std::vector<CandidateScore>
CombinationScorer::rank_product(const ScoringContext& ctx,
                                const std::vector<std::vector<Value>>& candidates,
                                std::size_t limit) const {
    std::vector<CandidateScore> scored;
    if (candidates.empty() || limit == 0) return scored;
    for (const auto& c : candidates) {
        if (c.empty()) return scored;
    }

    // Odometer over the per-position candidate lists.
    std::vector<std::size_t> cursor(candidates.size(), 0);
    Combination combo(candidates.size());
    while (true) {
        for (std::size_t p = 0; p < candidates.size(); ++p) combo[p] = candidates[p][cursor[p]];
        scored.push_back(score(ctx, combo));

        std::size_t p = candidates.size();
        while (p > 0) {
            --p;
            if (++cursor[p] < candidates[p].size()) break;
            cursor[p] = 0;
            if (p == 0) {
                p = candidates.size() + 1;  // wrapped the first digit: done
                break;
            }
        }
        if (p > candidates.size()) break;
    }

    std::sort(scored.begin(), scored.end(), [](const CandidateScore& a, const CandidateScore& b) {
        if (a.total != b.total) return a.total > b.total;
        return a.combination < b.combination;
    });
    if (scored.size() > limit) scored.resize(limit);
    return scored;
}

// ─── top_combinations ─────────────────────────────────────────────────────────

std::vector<CandidateScore>
CombinationScorer::top_combinations(const ScoringContext& ctx, std::size_t limit) const {
    if (ctx.total_draws < config_.min_draws_for_combinations) return {};

    std::vector<std::vector<Value>> candidates;
    candidates.reserve(ctx.layout.positions());
    for (std::size_t p = 0; p < ctx.layout.positions(); ++p) {
        const auto& r = ctx.layout.ranges[p];
        std::vector<ValueRank> ranks;
        ranks.reserve(r.size());
        for (Value v = r.min; v <= r.max; ++v) {
            ranks.push_back({v, score_value(ctx, p, v).total});
        }
        sort_ranks(ranks);
        candidates.push_back(take_values(ranks, config_.beam_width));
    }
    return rank_product(ctx, candidates, limit);
}

// ─── due_combinations ─────────────────────────────────────────────────────────

std::vector<CandidateScore>
CombinationScorer::due_combinations(const ScoringContext& ctx, std::size_t limit) const {
    if (ctx.total_draws < config_.min_draws_for_combinations) return {};

    std::vector<std::vector<Value>> candidates;
    candidates.reserve(ctx.layout.positions());
    for (std::size_t p = 0; p < ctx.layout.positions(); ++p) {
        std::vector<ValueRank> ranks;
        for (const auto& [value, stat] : ctx.stats[p]) {
            if (!stat.is_due()) continue;
            ranks.push_back({value, position_components(ctx, p, value).due});
        }
        if (ranks.empty()) return {};
        sort_ranks(ranks);
        candidates.push_back(take_values(ranks, config_.beam_width));
    }
    return rank_product(ctx, candidates, limit);
}

}  // namespace drawstat::scoring
