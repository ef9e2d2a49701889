#include <gtest/gtest.h>
#include "drawstat/transition.hpp"

#include <fmt/format.h>

#include <cmath>
#include <vector>

using namespace drawstat;
using namespace drawstat::transition;

namespace {

Snapshot series_snapshot(const std::vector<Value>& series) {
    std::vector<Draw> draws;
    for (std::size_t i = 0; i < series.size(); ++i) {
        draws.push_back(Draw{fmt::format("2024-01-{:02}", 1 + i), {series[i]}});
    }
    return Snapshot(DrawLayout::uniform(1, 0, 9), std::move(draws));
}

}  // namespace

// ─── build ────────────────────────────────────────────────────────────────────

TEST(Transition_Build, Alternating_DeterministicTransitions) {
    const auto table = TransitionModel::build(series_snapshot({1, 2, 1, 2, 1, 2}), 0);
    ASSERT_EQ(table.size(), 2u);

    ASSERT_EQ(table.at(1).size(), 1u);
    EXPECT_EQ(table.at(1)[0].to_value, 2);
    EXPECT_DOUBLE_EQ(table.at(1)[0].probability, 1.0);
    EXPECT_EQ(table.at(1)[0].count, 3u);

    ASSERT_EQ(table.at(2).size(), 1u);
    EXPECT_EQ(table.at(2)[0].to_value, 1);
    EXPECT_DOUBLE_EQ(table.at(2)[0].probability, 1.0);
    EXPECT_EQ(table.at(2)[0].count, 2u);
}

TEST(Transition_Build, RowsSumToOneAndSortedByTarget) {
    const auto table = TransitionModel::build(series_snapshot({3, 5, 3, 1, 3, 5, 3, 9, 3}), 0);
    for (const auto& [from, row] : table) {
        double sum = 0.0;
        for (std::size_t i = 0; i < row.size(); ++i) {
            sum += row[i].probability;
            if (i > 0) EXPECT_LT(row[i - 1].to_value, row[i].to_value);
        }
        EXPECT_NEAR(sum, 1.0, 1e-9) << "from " << from;
    }
    // 3 → {5, 1, 5, 9}
    EXPECT_DOUBLE_EQ(TransitionModel::probability(table, 3, 5), 0.5);
    EXPECT_DOUBLE_EQ(TransitionModel::probability(table, 3, 1), 0.25);
    EXPECT_DOUBLE_EQ(TransitionModel::probability(table, 3, 7), 0.0);
    EXPECT_DOUBLE_EQ(TransitionModel::probability(table, 4, 3), 0.0);
}

TEST(Transition_Build, RecordsLastSeenIndex) {
    const auto table = TransitionModel::build(series_snapshot({3, 5, 3, 5, 3}), 0);
    EXPECT_EQ(table.at(3)[0].last_seen_index, 3u);
    EXPECT_EQ(table.at(5)[0].last_seen_index, 4u);
}

TEST(Transition_Build, ShortHistory_Empty) {
    EXPECT_TRUE(TransitionModel::build(series_snapshot({4}), 0).empty());
    EXPECT_TRUE(TransitionModel::build(series_snapshot({}), 0).empty());
    EXPECT_TRUE(TransitionModel::build(series_snapshot({4, 5}), 1).empty());
}

// ─── skip adjustment ──────────────────────────────────────────────────────────

TEST(Transition_Skip, CountsRepeatsBeforeLatest) {
    EXPECT_EQ(TransitionModel::skip_count(series_snapshot({1, 2, 3}), 0), 0u);
    EXPECT_EQ(TransitionModel::skip_count(series_snapshot({1, 3, 3, 3}), 0), 2u);
    EXPECT_EQ(TransitionModel::skip_count(series_snapshot({3}), 0), 0u);
}

TEST(Transition_Skip, FactorDecaysToFloor) {
    EXPECT_DOUBLE_EQ(TransitionModel::skip_factor(0), 1.0);
    EXPECT_NEAR(TransitionModel::skip_factor(3), 0.7, 1e-12);
    EXPECT_NEAR(TransitionModel::skip_factor(9), 0.1, 1e-12);
    EXPECT_NEAR(TransitionModel::skip_factor(50), 0.1, 1e-12);
}

// ─── predict_next ─────────────────────────────────────────────────────────────

TEST(Transition_Predict, RankedByProbabilityThenRecency) {
    // 3 → 5 twice, 3 → 1 once, 3 → 9 once (9 more recent than 1).
    const auto table = TransitionModel::build(series_snapshot({3, 5, 3, 1, 3, 5, 3, 9, 3}), 0);
    const auto ranked = TransitionModel::predict_next(table, 3, 10);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].to_value, 5);
    EXPECT_EQ(ranked[1].to_value, 9);
    EXPECT_EQ(ranked[2].to_value, 1);
}

TEST(Transition_Predict, TopKTruncates) {
    const auto table = TransitionModel::build(series_snapshot({3, 5, 3, 1, 3, 5, 3, 9, 3}), 0);
    EXPECT_EQ(TransitionModel::predict_next(table, 3, 1).size(), 1u);
    EXPECT_TRUE(TransitionModel::predict_next(table, 3, 0).empty());
}

TEST(Transition_Predict, UnknownValue_Empty) {
    const auto table = TransitionModel::build(series_snapshot({1, 2, 1}), 0);
    EXPECT_TRUE(TransitionModel::predict_next(table, 7, 5).empty());
}

TEST(Transition_Predict, SkipCountScalesProbability) {
    const auto table = TransitionModel::build(series_snapshot({1, 2, 1, 2}), 0);
    const auto ranked = TransitionModel::predict_next(table, 1, 5, 2);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_DOUBLE_EQ(ranked[0].probability, 1.0);
    EXPECT_NEAR(ranked[0].adjusted_probability, 0.8, 1e-12);
    EXPECT_EQ(ranked[0].skip_count, 2u);
}

TEST(Transition_Predict, SnapshotOverload_AppliesSkipOnlyToLatestValue) {
    // Latest value 4 has repeated twice before the final draw.
    const auto snap = series_snapshot({4, 6, 4, 4, 4});
    const auto from_latest = TransitionModel::predict_next(snap, 0, 4, 5);
    ASSERT_FALSE(from_latest.empty());
    for (const auto& t : from_latest) {
        EXPECT_EQ(t.skip_count, 2u);
        EXPECT_NEAR(t.adjusted_probability, t.probability * 0.8, 1e-12);
    }

    const auto from_other = TransitionModel::predict_next(snap, 0, 6, 5);
    ASSERT_EQ(from_other.size(), 1u);
    EXPECT_EQ(from_other[0].skip_count, 0u);
    EXPECT_DOUBLE_EQ(from_other[0].adjusted_probability, 1.0);
}
