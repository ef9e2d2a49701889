#include <gtest/gtest.h>
#include "drawstat/statistics.hpp"

#include <cmath>
#include <vector>

using namespace drawstat::stats;

// ─── Descriptive ──────────────────────────────────────────────────────────────

TEST(Stats_Descriptive, EmptyInputIsNeutral) {
    const std::vector<double> none;
    EXPECT_DOUBLE_EQ(mean(none), 0.0);
    EXPECT_DOUBLE_EQ(population_variance(none), 0.0);
    EXPECT_DOUBLE_EQ(sample_variance(none), 0.0);
    EXPECT_DOUBLE_EQ(median(none), 0.0);
    EXPECT_DOUBLE_EQ(mode(none), 0.0);
}

TEST(Stats_Descriptive, KnownValues) {
    const std::vector<double> xs{1, 2, 2, 4};
    EXPECT_DOUBLE_EQ(mean(xs), 2.25);
    EXPECT_DOUBLE_EQ(median(xs), 2.0);
    EXPECT_DOUBLE_EQ(mode(xs), 2.0);
    EXPECT_DOUBLE_EQ(population_variance(xs), 1.1875);
    EXPECT_DOUBLE_EQ(sample_variance(xs), 4.75 / 3.0);
}

TEST(Stats_Descriptive, ModeTiesResolveToSmallest) {
    const std::vector<double> xs{5, 3, 5, 3, 9};
    EXPECT_DOUBLE_EQ(mode(xs), 3.0);
}

TEST(Stats_Pearson, DegenerateInputs_Nullopt) {
    const std::vector<double> a{1, 2, 3};
    const std::vector<double> flat{4, 4, 4};
    const std::vector<double> short_side{1, 2};
    EXPECT_FALSE(pearson(a, flat).has_value());
    EXPECT_FALSE(pearson(a, short_side).has_value());
    EXPECT_FALSE(pearson(std::vector<double>{1}, std::vector<double>{2}).has_value());
}

TEST(Stats_Pearson, PerfectLinear) {
    const std::vector<double> x{1, 2, 3, 4};
    const std::vector<double> y{10, 8, 6, 4};
    ASSERT_TRUE(pearson(x, y).has_value());
    EXPECT_NEAR(*pearson(x, y), -1.0, 1e-12);
}

TEST(Stats_Autocorrelation, AlternatingIsNegative) {
    const std::vector<double> xs{1, 0, 1, 0, 1, 0};
    EXPECT_LT(lag1_autocorrelation(xs), -0.5);
    EXPECT_DOUBLE_EQ(lag1_autocorrelation(std::vector<double>{3, 3, 3}), 0.0);
}

TEST(Stats_Volatility, RmsOfDifferences) {
    const std::vector<double> xs{0.0, 0.3, 0.0};
    EXPECT_NEAR(volatility(xs), 0.3, 1e-12);
    EXPECT_DOUBLE_EQ(volatility(std::vector<double>{0.5}), 0.0);
}

// ─── Distributions ────────────────────────────────────────────────────────────

TEST(Stats_Normal, CriticalValues) {
    EXPECT_NEAR(normal_critical(0.95), 1.959964, 1e-5);
    EXPECT_NEAR(normal_critical(0.99), 2.575829, 1e-5);
    EXPECT_NEAR(normal_cdf(0.0), 0.5, 1e-12);
    EXPECT_NEAR(two_tailed_normal_p(1.959964), 0.05, 1e-5);
    EXPECT_DOUBLE_EQ(two_tailed_normal_p(0.0), 1.0);
}

TEST(Stats_T, LargeDofApproachesNormal) {
    EXPECT_NEAR(two_tailed_t_p(1.959964, 1e6), 0.05, 1e-4);
    EXPECT_DOUBLE_EQ(two_tailed_t_p(2.0, 0.0), 1.0);
}

TEST(Stats_ChiSquare, UpperTail) {
    EXPECT_NEAR(chi_square_upper_p(3.841459, 1.0), 0.05, 1e-5);
    EXPECT_DOUBLE_EQ(chi_square_upper_p(0.0, 1.0), 1.0);
}

TEST(Stats_PoissonBinomial, MatchesClosedForms) {
    const std::vector<double> ps{0.1, 0.1, 0.1};
    EXPECT_DOUBLE_EQ(probability_at_least(ps, 0), 1.0);
    EXPECT_NEAR(probability_at_least(ps, 1), 1.0 - 0.9 * 0.9 * 0.9, 1e-12);
    EXPECT_NEAR(probability_at_least(ps, 3), 0.001, 1e-12);
    EXPECT_DOUBLE_EQ(probability_at_least(ps, 4), 0.0);
}

// ─── Intervals ────────────────────────────────────────────────────────────────

TEST(Stats_Wilson, ZeroTrials_Empty) {
    EXPECT_EQ(wilson_interval(0, 0, 0.95), (Interval{0.0, 0.0}));
}

TEST(Stats_Wilson, BracketsObservedRate) {
    const auto ci = wilson_interval(30, 100, 0.95);
    EXPECT_LE(ci.lower, 0.3);
    EXPECT_GE(ci.upper, 0.3);
    EXPECT_NEAR(ci.lower, 0.2189, 1e-3);
    EXPECT_NEAR(ci.upper, 0.3958, 1e-3);
}

TEST(Stats_Wilson, ExtremesStayInUnitInterval) {
    const auto none = wilson_interval(0, 20, 0.95);
    EXPECT_DOUBLE_EQ(none.lower, 0.0);
    EXPECT_GT(none.upper, 0.0);

    const auto all = wilson_interval(20, 20, 0.95);
    EXPECT_DOUBLE_EQ(all.upper, 1.0);
    EXPECT_LT(all.lower, 1.0);
}

TEST(Stats_Wilson, HigherLevelIsWider) {
    const auto narrow = wilson_interval(40, 100, 0.80);
    const auto wide   = wilson_interval(40, 100, 0.99);
    EXPECT_LT(wide.lower, narrow.lower);
    EXPECT_GT(wide.upper, narrow.upper);
}

TEST(Stats_MeanInterval, SingleValueCollapses) {
    const auto ci = mean_confidence_interval(std::vector<double>{0.4}, 0.95);
    EXPECT_DOUBLE_EQ(ci.lower, 0.4);
    EXPECT_DOUBLE_EQ(ci.upper, 0.4);
}

TEST(Stats_MeanInterval, StudentT) {
    // mean 2, sample variance 2/3, n 4: t(0.975, 3) = 3.182446
    const std::vector<double> xs{1, 2, 2, 3};
    const auto ci = mean_confidence_interval(xs, 0.95);
    const double half = 3.182446 * std::sqrt(2.0 / 3.0) / 2.0;
    EXPECT_DOUBLE_EQ(ci.mean, 2.0);
    EXPECT_NEAR(ci.lower, 2.0 - half, 1e-5);
    EXPECT_NEAR(ci.upper, 2.0 + half, 1e-5);
}

// ─── Tests ────────────────────────────────────────────────────────────────────

TEST(Stats_BinomialZ, AtBaseline_NotSignificant) {
    const auto z = binomial_z_test(50, 100, 0.5);
    EXPECT_DOUBLE_EQ(z.z, 0.0);
    EXPECT_DOUBLE_EQ(z.p_value, 1.0);
}

TEST(Stats_BinomialZ, FarAboveBaseline_Significant) {
    const auto z = binomial_z_test(40, 100, 0.1);
    EXPECT_NEAR(z.z, 10.0, 1e-9);
    EXPECT_LT(z.p_value, 1e-6);
}

TEST(Stats_BinomialZ, DegenerateBaseline) {
    EXPECT_DOUBLE_EQ(binomial_z_test(0, 10, 0.0).p_value, 1.0);
    EXPECT_DOUBLE_EQ(binomial_z_test(3, 10, 0.0).p_value, 0.0);
    EXPECT_DOUBLE_EQ(binomial_z_test(0, 0, 0.3).p_value, 1.0);
}

TEST(Stats_TwoProportion, UnpooledStandardError) {
    const auto z = two_proportion_z_test(0.5, 100, 0.3, 100);
    const double se = std::sqrt(0.25 / 100 + 0.21 / 100);
    EXPECT_NEAR(z.z, 0.2 / se, 1e-12);
    EXPECT_LT(z.p_value, 0.05);
    EXPECT_DOUBLE_EQ(two_proportion_z_test(0.0, 10, 0.0, 10).p_value, 1.0);
}

TEST(Stats_TTest, ConstantSample_Neutral) {
    const auto t = one_sample_t_test(std::vector<double>{0.25, 0.25, 0.25}, 0.1);
    EXPECT_DOUBLE_EQ(t.t, 0.0);
    EXPECT_DOUBLE_EQ(t.dof, 2.0);
    EXPECT_DOUBLE_EQ(t.p_value, 1.0);
}

TEST(Stats_TTest, KnownStatistic) {
    // mean 2, sd √(2/3), n 4 → t = 1 / (sd / 2)
    const auto t = one_sample_t_test(std::vector<double>{1, 2, 2, 3}, 1.0);
    EXPECT_NEAR(t.t, 2.0 / std::sqrt(2.0 / 3.0), 1e-12);
    EXPECT_DOUBLE_EQ(t.dof, 3.0);
    EXPECT_GT(t.p_value, 0.0);
    EXPECT_LT(t.p_value, 1.0);
}

TEST(Stats_MannKendall, MonotoneTrendIsSignificant) {
    const std::vector<double> up{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    EXPECT_LT(mann_kendall_p(up), 0.01);
    EXPECT_DOUBLE_EQ(mann_kendall_p(std::vector<double>{1, 2}), 1.0);
}
