#include <gtest/gtest.h>
#include "drawstat/validation.hpp"

#include <fmt/format.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace drawstat;
using namespace drawstat::validation;

namespace {

/// 50 draws in five blocks of ten. Block i opens with i + 1 draws of
/// {1,1,1}; the rest are {4,4,4}. Predicting {4,4,4} therefore scores
/// 0.9, 0.8, 0.7, 0.6, 0.5 over five folds.
SnapshotPtr declining_snapshot() {
    std::vector<Draw> draws;
    for (std::size_t block = 0; block < 5; ++block) {
        for (std::size_t j = 0; j < 10; ++j) {
            const std::size_t i = block * 10 + j;
            const Value v = j <= block ? 1 : 4;
            draws.push_back(Draw{fmt::format("2023-{:02}-{:02}", 1 + i / 28, 1 + i % 28),
                                 {v, v, v}});
        }
    }
    return std::make_shared<const Snapshot>(DrawLayout::uniform(3, 0, 9), std::move(draws));
}

CrossValidationReport declining_report(const PredictionValidator& v) {
    return v.cross_validate([](const Snapshot&, std::size_t) {
        return std::vector<Prediction>{Prediction{{4, 4, 4}, 0.5, 1}};
    }, 5);
}

}  // namespace

// ─── Cross-validation aggregates ──────────────────────────────────────────────

TEST(Significance_Report, FoldAccuraciesAndExtremes) {
    const PredictionValidator v(declining_snapshot());
    const auto report = declining_report(v);

    ASSERT_EQ(report.folds.size(), 5u);
    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_NEAR(report.folds[i].result.accuracy, 0.9 - 0.1 * static_cast<double>(i), 1e-12);
    }
    EXPECT_NEAR(report.mean_accuracy, 0.7, 1e-12);
    EXPECT_NEAR(report.std_dev_accuracy, std::sqrt(0.02), 1e-9);
    EXPECT_EQ(report.best_fold, 0u);
    EXPECT_EQ(report.worst_fold, 4u);
}

TEST(Significance_Report, StabilityOfALinearDecline) {
    const PredictionValidator v(declining_snapshot());
    const auto report = declining_report(v);
    EXPECT_NEAR(report.stability.autocorrelation, 0.5, 1e-9);
    EXPECT_NEAR(report.stability.volatility, 0.1, 1e-9);
    EXPECT_LT(report.stability.trend_p_value, 0.05);
}

// ─── significance_tests ───────────────────────────────────────────────────────

TEST(Significance_Tests, AccuracyAboveBaseline) {
    const PredictionValidator v(declining_snapshot());
    const auto s = v.significance_tests(declining_report(v));

    EXPECT_NEAR(s.baseline, 0.271, 1e-12);
    EXPECT_GT(s.accuracy_test.t, 0.0);
    EXPECT_DOUBLE_EQ(s.accuracy_test.dof, 4.0);
    EXPECT_TRUE(s.accuracy_significant);
    EXPECT_GT(s.accuracy_test.cohens_d, 1.0);
    EXPECT_GE(s.accuracy_interval.lower, 0.0);
    EXPECT_LE(s.accuracy_interval.upper, 1.0);
    EXPECT_LT(s.accuracy_interval.lower, 0.7);
    EXPECT_GT(s.accuracy_interval.upper, 0.7);
}

TEST(Significance_Tests, OneBucketPerPosition) {
    const PredictionValidator v(declining_snapshot());
    const auto s = v.significance_tests(declining_report(v));

    ASSERT_EQ(s.buckets.size(), 3u);
    for (std::size_t k = 0; k < 3; ++k) {
        const auto& b = s.buckets[k];
        EXPECT_EQ(b.min_matches, k + 1);
        EXPECT_NEAR(b.expected_rate, v.random_baseline(k + 1), 1e-12);
        // Every match is all-or-nothing, so each bucket sees the same rate.
        EXPECT_NEAR(b.observed_rate, 0.7, 1e-9);
        EXPECT_TRUE(b.is_significant);
    }
}

TEST(Significance_Tests, BoxModeAgainstEveryDraw_NotSignificant) {
    // All 1000 three-digit draws in order; a fixed {1,2,3} box pick hits each
    // fold at varying rates but exactly at the random rate overall.
    std::vector<Draw> draws;
    for (Value i = 0; i < 1000; ++i) {
        const auto n = static_cast<std::size_t>(i);
        draws.push_back(Draw{fmt::format("2023-{:02}-{:02}", 1 + n / 28, 1 + n % 28),
                             {i / 100, (i / 10) % 10, i % 10}});
    }
    const auto snap =
        std::make_shared<const Snapshot>(DrawLayout::uniform(3, 0, 9), std::move(draws));

    ValidationConfig cfg;
    cfg.match_mode = MatchMode::Box;
    const PredictionValidator v(snap, cfg);
    const auto report = v.cross_validate([](const Snapshot&, std::size_t) {
        return std::vector<Prediction>{Prediction{{1, 2, 3}, 0.5, 1}};
    }, 5);
    const auto s = v.significance_tests(report);

    EXPECT_NEAR(report.mean_accuracy, 0.657, 1e-9);
    EXPECT_NEAR(s.baseline, 0.657, 1e-12);
    EXPECT_FALSE(s.accuracy_significant);
    ASSERT_EQ(s.buckets.size(), 3u);
    for (const auto& b : s.buckets) {
        EXPECT_NEAR(b.observed_rate, b.expected_rate, 1e-9) << b.min_matches << "+";
        EXPECT_FALSE(b.is_significant) << b.min_matches << "+";
    }
    EXPECT_NEAR(s.buckets[0].expected_rate, 0.657, 1e-12);
    EXPECT_NEAR(s.buckets[2].expected_rate, 0.006, 1e-12);
}

TEST(Significance_Tests, EmptyReport_Neutral) {
    const PredictionValidator v(declining_snapshot());
    const auto s = v.significance_tests(CrossValidationReport{});
    EXPECT_NEAR(s.baseline, 0.271, 1e-12);
    EXPECT_FALSE(s.accuracy_significant);
    for (const auto& b : s.buckets) {
        EXPECT_DOUBLE_EQ(b.observed_rate, 0.0);
        EXPECT_DOUBLE_EQ(b.p_value, 1.0);
        EXPECT_FALSE(b.is_significant);
    }
}

// ─── Recommendations and rendering ────────────────────────────────────────────

TEST(Significance_Recommendations, NotSignificant_SuggestsRefinement) {
    SignificanceReport s;
    const auto lines = recommendations(s);
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.front().find("not significantly different"), std::string::npos);
}

TEST(Significance_Recommendations, SmallEffect) {
    SignificanceReport s;
    s.accuracy_significant = true;
    s.accuracy_test.cohens_d = 0.2;
    EXPECT_NE(recommendations(s).front().find("small"), std::string::npos);
}

TEST(Significance_Recommendations, FlagsInstabilityAndBuckets) {
    SignificanceReport s;
    s.accuracy_significant   = true;
    s.accuracy_test.cohens_d = 2.0;
    s.stability.autocorrelation = -0.6;
    s.stability.volatility      = 0.25;
    s.buckets = {BucketSignificance{.min_matches = 1, .is_significant = true},
                 BucketSignificance{.min_matches = 2, .is_significant = false},
                 BucketSignificance{.min_matches = 3, .is_significant = true}};

    const auto lines = recommendations(s);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_NE(lines[0].find("meaningful"), std::string::npos);
    EXPECT_NE(lines[1].find("autocorrelated"), std::string::npos);
    EXPECT_NE(lines[2].find("volatile"), std::string::npos);
    EXPECT_EQ(lines[3], "Significant hit rates for: 1+, 3+");
}

TEST(Significance_Render, ContainsFoldsAndRecommendations) {
    const PredictionValidator v(declining_snapshot());
    const auto report = declining_report(v);
    const auto text = render_report(report, v.significance_tests(report));

    EXPECT_NE(text.find("Cross-validation: 5 folds"), std::string::npos);
    EXPECT_NE(text.find("mean accuracy   0.7000"), std::string::npos);
    EXPECT_NE(text.find("best fold       1"), std::string::npos);
    EXPECT_NE(text.find("worst fold      5"), std::string::npos);
    EXPECT_NE(text.find("3+ matches"), std::string::npos);
    EXPECT_NE(text.find("Recommendations:"), std::string::npos);
}

TEST(Significance_Render, InvalidFoldShowsError) {
    CrossValidationReport report;
    FoldResult f;
    f.test_end     = 6;
    f.result.error = "no predictions provided";
    report.folds.push_back(f);

    const auto text = render_report(report, SignificanceReport{});
    EXPECT_NE(text.find("invalid: no predictions provided"), std::string::npos);
}
