#include <gtest/gtest.h>
#include "drawstat/scoring.hpp"
#include "drawstat/errors.hpp"

#include <fmt/format.h>

#include <vector>

using namespace drawstat;
using namespace drawstat::scoring;

namespace {

Snapshot rows_snapshot(const std::vector<std::vector<Value>>& rows, std::size_t positions) {
    std::vector<Draw> draws;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        draws.push_back(Draw{fmt::format("2024-{:02}-{:02}", 1 + i / 28, 1 + i % 28), rows[i]});
    }
    return Snapshot(DrawLayout::uniform(positions, 0, 9), std::move(draws));
}

Snapshot series_snapshot(const std::vector<Value>& series) {
    std::vector<std::vector<Value>> rows;
    for (Value v : series) rows.push_back({v});
    return rows_snapshot(rows, 1);
}

/// Deterministic three-position history of `n` draws.
Snapshot mixed_snapshot(std::size_t n) {
    std::vector<std::vector<Value>> rows;
    for (std::size_t i = 0; i < n; ++i) {
        rows.push_back({static_cast<Value>((i * 7) % 10),
                        static_cast<Value>((i * 3 + 1) % 10),
                        static_cast<Value>((i * i + 2) % 10)});
    }
    return rows_snapshot(rows, 3);
}

constexpr double kEps = 1e-12;

}  // namespace

// ─── ScoringWeights ───────────────────────────────────────────────────────────

TEST(Scoring_Weights, DefaultsAlreadyNormalized) {
    const auto w = ScoringWeights{}.normalized();
    EXPECT_NEAR(w.due + w.parity + w.hot_cold + w.transition + w.correlation, 1.0, kEps);
    EXPECT_NEAR(w.due, 0.30, kEps);
    EXPECT_NEAR(w.transition, 0.25, kEps);
}

TEST(Scoring_Weights, NegativeClampedRestRescaled) {
    const auto w = ScoringWeights{.due = -1.0, .parity = 1.0, .hot_cold = 1.0,
                                  .transition = 0.0, .correlation = 2.0}.normalized();
    EXPECT_DOUBLE_EQ(w.due, 0.0);
    EXPECT_NEAR(w.parity, 0.25, kEps);
    EXPECT_NEAR(w.correlation, 0.5, kEps);
}

TEST(Scoring_Weights, AllZero_FallsBackToEqual) {
    const auto w = ScoringWeights{0, 0, 0, 0, 0}.normalized();
    EXPECT_DOUBLE_EQ(w.due, 0.2);
    EXPECT_DOUBLE_EQ(w.correlation, 0.2);
}

// ─── validate ─────────────────────────────────────────────────────────────────

TEST(Scoring_Validate, WrongArity_Throws) {
    const auto layout = DrawLayout::uniform(3, 0, 9);
    EXPECT_THROW(CombinationScorer::validate(layout, {1, 2}), InvalidCombinationError);
    EXPECT_THROW(CombinationScorer::validate(layout, {1, 2, 3, 4}), InvalidCombinationError);
}

TEST(Scoring_Validate, OutOfRange_Throws) {
    const auto layout = DrawLayout::uniform(3, 0, 9);
    EXPECT_THROW(CombinationScorer::validate(layout, {1, 2, 10}), InvalidCombinationError);
    EXPECT_THROW(CombinationScorer::validate(layout, {-1, 2, 3}), InvalidCombinationError);
}

TEST(Scoring_Validate, IsInvalidArgument) {
    const auto layout = DrawLayout::uniform(2, 0, 9);
    EXPECT_THROW(CombinationScorer::validate(layout, {}), std::invalid_argument);
    EXPECT_NO_THROW(CombinationScorer::validate(layout, {0, 9}));
}

// ─── score ────────────────────────────────────────────────────────────────────

TEST(Scoring_Score, HotRepeatingValue_ComponentsAndTotal) {
    const auto snap = series_snapshot(std::vector<Value>(20, 7));
    const auto ctx = ScoringContext::build(snap);
    const auto s = CombinationScorer{}.score(ctx, {7});

    EXPECT_DOUBLE_EQ(s.due, 0.0);
    EXPECT_DOUBLE_EQ(s.hot_cold, 1.0);
    EXPECT_DOUBLE_EQ(s.transition, 1.0);
    EXPECT_DOUBLE_EQ(s.parity, 1.0);  // a single value is as balanced as it gets
    EXPECT_DOUBLE_EQ(s.correlation, 1.0);
    EXPECT_NEAR(s.total, 0.7, kEps);
    EXPECT_NEAR(s.confidence, 0.8, kEps);  // 4 of 5 signals
}

TEST(Scoring_Score, NeverSeenValue_OnlyCombinationSignals) {
    const auto snap = series_snapshot(std::vector<Value>(20, 7));
    const auto s = CombinationScorer{}.score(ScoringContext::build(snap), {3});
    EXPECT_DOUBLE_EQ(s.due, 0.0);
    EXPECT_DOUBLE_EQ(s.hot_cold, 0.0);
    EXPECT_DOUBLE_EQ(s.transition, 0.0);
    EXPECT_NEAR(s.total, 0.25, kEps);
    EXPECT_NEAR(s.confidence, 0.4, kEps);
}

TEST(Scoring_Score, ParityBalance_OddArityReachesOne) {
    const auto snap = mixed_snapshot(10);
    const auto ctx = ScoringContext::build(snap);
    const CombinationScorer scorer;
    // Three positions: one or two evens is the most even split.
    EXPECT_DOUBLE_EQ(scorer.score(ctx, {1, 2, 3}).parity, 1.0);
    EXPECT_DOUBLE_EQ(scorer.score(ctx, {2, 4, 5}).parity, 1.0);
    EXPECT_DOUBLE_EQ(scorer.score(ctx, {2, 4, 6}).parity, 0.0);
    EXPECT_DOUBLE_EQ(scorer.score(ctx, {1, 3, 5}).parity, 0.0);
}

TEST(Scoring_Score, ParityBalance_EvenArity) {
    const auto snap = rows_snapshot({{1, 2, 3, 4}, {5, 6, 7, 8}}, 4);
    const auto ctx = ScoringContext::build(snap);
    const CombinationScorer scorer;
    EXPECT_DOUBLE_EQ(scorer.score(ctx, {1, 2, 3, 4}).parity, 1.0);
    EXPECT_DOUBLE_EQ(scorer.score(ctx, {2, 4, 6, 5}).parity, 0.5);
    EXPECT_DOUBLE_EQ(scorer.score(ctx, {2, 4, 6, 8}).parity, 0.0);
}

TEST(Scoring_Score, BoundedAndDeterministic) {
    const auto snap = mixed_snapshot(40);
    const auto ctx = ScoringContext::build(snap);
    const CombinationScorer scorer;
    for (Value a = 0; a <= 9; a += 3) {
        for (Value b = 0; b <= 9; b += 4) {
            const Combination combo{a, b, 5};
            const auto s = scorer.score(ctx, combo);
            EXPECT_GE(s.total, 0.0);
            EXPECT_LE(s.total, 1.0);
            EXPECT_GE(s.confidence, 0.0);
            EXPECT_LE(s.confidence, 1.0);
            EXPECT_EQ(s, scorer.score(ctx, combo));
        }
    }
}

TEST(Scoring_Score, SnapshotOverloadMatchesContext) {
    const auto snap = mixed_snapshot(25);
    const CombinationScorer scorer;
    EXPECT_EQ(scorer.score(snap, {4, 1, 2}),
              scorer.score(ScoringContext::build(snap), {4, 1, 2}));
}

TEST(Scoring_Score, InvalidCombination_Throws) {
    const auto snap = mixed_snapshot(5);
    const auto ctx = ScoringContext::build(snap);
    EXPECT_THROW((void)CombinationScorer{}.score(ctx, {1, 2}), InvalidCombinationError);
}

// ─── score_value ──────────────────────────────────────────────────────────────

TEST(Scoring_ScoreValue, FavoursMissingParity) {
    const auto snap = series_snapshot(std::vector<Value>(20, 7));
    const auto ctx = ScoringContext::build(snap);
    const CombinationScorer scorer;

    const auto odd = scorer.score_value(ctx, 0, 7);
    EXPECT_DOUBLE_EQ(odd.parity, 0.5);
    EXPECT_NEAR(odd.total, 0.65, kEps);
    EXPECT_NEAR(odd.confidence, 0.8, kEps);
    EXPECT_EQ(odd.combination, (Combination{7}));

    const auto even = scorer.score_value(ctx, 0, 4);
    EXPECT_DOUBLE_EQ(even.parity, 1.0);
    EXPECT_NEAR(even.total, 0.25, kEps);
    EXPECT_NEAR(even.confidence, 0.4, kEps);
}

TEST(Scoring_ScoreValue, EmptyHistory_NeutralParity) {
    const auto snap = series_snapshot({});
    const auto s = CombinationScorer{}.score_value(ScoringContext::build(snap), 0, 2);
    EXPECT_DOUBLE_EQ(s.parity, 0.5);
    EXPECT_DOUBLE_EQ(s.transition, 0.0);
}

TEST(Scoring_ScoreValue, OutOfRange_Throws) {
    const auto ctx = ScoringContext::build(series_snapshot({1, 2}));
    EXPECT_THROW((void)CombinationScorer{}.score_value(ctx, 1, 2), InvalidCombinationError);
    EXPECT_THROW((void)CombinationScorer{}.score_value(ctx, 0, 12), InvalidCombinationError);
}

// ─── top_combinations / due_combinations ──────────────────────────────────────

TEST(Scoring_Top, BelowMinimumDraws_Empty) {
    const auto ctx = ScoringContext::build(mixed_snapshot(19));
    EXPECT_TRUE(CombinationScorer{}.top_combinations(ctx, 5).empty());
}

TEST(Scoring_Top, SingleHotValue_RankedFirst) {
    const auto ctx = ScoringContext::build(series_snapshot(std::vector<Value>(20, 7)));
    const auto top = CombinationScorer{}.top_combinations(ctx, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].combination, (Combination{7}));
    EXPECT_EQ(top[1].combination, (Combination{0}));  // ties: smaller combination
}

TEST(Scoring_Top, SortedDescendingAndLimited) {
    const auto ctx = ScoringContext::build(mixed_snapshot(30));
    const auto top = CombinationScorer{}.top_combinations(ctx, 10);
    ASSERT_EQ(top.size(), 10u);
    for (std::size_t i = 1; i < top.size(); ++i) {
        EXPECT_GE(top[i - 1].total, top[i].total);
    }
}

TEST(Scoring_Top, BeamWidthBoundsCandidates) {
    ScoringConfig cfg;
    cfg.beam_width = 2;
    const auto ctx = ScoringContext::build(mixed_snapshot(30));
    EXPECT_EQ(CombinationScorer{cfg}.top_combinations(ctx, 100).size(), 8u);  // 2³
}

TEST(Scoring_Due, OnlyOverdueValues) {
    // 1 at indices 0, 2, 4 of 20: gaps [2, 2, 15], average 19/3 < 15.
    std::vector<Value> series(20, 0);
    series[0] = series[2] = series[4] = 1;
    const auto ctx = ScoringContext::build(series_snapshot(series));
    const auto due = CombinationScorer{}.due_combinations(ctx, 5);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].combination, (Combination{1}));
    EXPECT_DOUBLE_EQ(due[0].due, 1.0);
}

TEST(Scoring_Due, PositionWithoutDueValue_Empty) {
    const auto ctx = ScoringContext::build(series_snapshot(std::vector<Value>(20, 7)));
    EXPECT_TRUE(CombinationScorer{}.due_combinations(ctx, 5).empty());
}

// ─── box_straight_hits ────────────────────────────────────────────────────────

TEST(Scoring_BoxStraight, CountsExactAndPermutedHits) {
    const auto snap = rows_snapshot({{1, 2, 3}, {3, 2, 1}, {1, 2, 3}, {4, 5, 6}}, 3);
    const auto h = CombinationScorer::box_straight_hits(snap, {1, 2, 3});
    EXPECT_EQ(h.window, 4u);
    EXPECT_EQ(h.straight_hits, 2u);
    EXPECT_EQ(h.box_hits, 3u);
    EXPECT_DOUBLE_EQ(h.straight_frequency, 0.5);
    EXPECT_DOUBLE_EQ(h.box_frequency, 0.75);
    ASSERT_TRUE(h.draws_since_straight.has_value());
    EXPECT_EQ(*h.draws_since_straight, 1u);
    EXPECT_EQ(*h.draws_since_box, 1u);
}

TEST(Scoring_BoxStraight, WindowLimitsLookback) {
    const auto snap = rows_snapshot({{1, 2, 3}, {4, 5, 6}, {7, 8, 9}}, 3);
    const auto h = CombinationScorer::box_straight_hits(snap, {1, 2, 3}, 2);
    EXPECT_EQ(h.window, 2u);
    EXPECT_EQ(h.straight_hits, 0u);
    EXPECT_FALSE(h.draws_since_straight.has_value());
}
