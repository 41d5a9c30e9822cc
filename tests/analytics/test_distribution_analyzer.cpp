// tests/analytics/test_distribution_analyzer.cpp
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "test_utils.hpp"
#include "trade_journal/analytics/distribution_analyzer.hpp"

using namespace trade_journal;
using trade_journal::testing::create_pair_series;

class DistributionAnalyzerTest : public ::testing::Test {
protected:
    DistributionAnalyzer analyzer{20};
};

TEST_F(DistributionAnalyzerTest, RejectsPercentOutsideRange) {
    for (double pct : {4.9, 30.1, 0.0, -10.0, std::numeric_limits<double>::quiet_NaN()}) {
        auto result = analyzer.analyze({}, pct);
        ASSERT_TRUE(result.is_error()) << pct;
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONCENTRATION);
    }
    EXPECT_TRUE(analyzer.analyze({}, 5.0).is_ok());
    EXPECT_TRUE(analyzer.analyze({}, 30.0).is_ok());
}

TEST_F(DistributionAnalyzerTest, EmptyInputReportsNoTrades) {
    auto result = analyzer.analyze({}, 10.0);
    ASSERT_TRUE(result.is_ok());
    const auto& stats = result.value().concentration;
    EXPECT_TRUE(result.value().histogram.empty());
    EXPECT_EQ(stats.total_trades, 0);
    EXPECT_DOUBLE_EQ(stats.stability_score, 100.0);
    ASSERT_EQ(stats.insights.size(), 1u);
    EXPECT_EQ(stats.insights[0], "No trades in the selected timeframe.");
}

TEST_F(DistributionAnalyzerTest, TopShareOfWinners) {
    std::vector<double> pnls;
    for (int i = 1; i <= 20; ++i) {
        pnls.push_back(i);
    }
    auto result = analyzer.analyze(create_pair_series(pnls), 10.0);
    ASSERT_TRUE(result.is_ok());
    const auto& stats = result.value().concentration;

    EXPECT_EQ(stats.total_trades, 20);
    EXPECT_EQ(stats.profitable_trades_count, 20);
    EXPECT_EQ(stats.losing_trades_count, 0);
    EXPECT_EQ(stats.top_k_profit, 2);
    EXPECT_EQ(stats.top_k_loss, 0);
    EXPECT_DOUBLE_EQ(stats.profit_share_top, 39.0 / 210.0);
    EXPECT_DOUBLE_EQ(stats.loss_share_top, 0.0);
    EXPECT_DOUBLE_EQ(stats.mean_return, 10.5);
    EXPECT_DOUBLE_EQ(stats.median_return, 10.5);
    EXPECT_DOUBLE_EQ(stats.stability_score,
                     DistributionAnalyzer::stability_score(39.0 / 210.0, pnls));
    EXPECT_GE(stats.stability_score, 0.0);
    EXPECT_LE(stats.stability_score, 100.0);
    EXPECT_FALSE(stats.insights.empty());
}

TEST_F(DistributionAnalyzerTest, LossShareUsesWorstLosers) {
    auto result = analyzer.analyze(create_pair_series({-100, -10, -10, -10, 50}), 20.0);
    ASSERT_TRUE(result.is_ok());
    const auto& stats = result.value().concentration;
    EXPECT_EQ(stats.top_k_loss, 1);
    EXPECT_DOUBLE_EQ(stats.loss_share_top, 100.0 / 130.0);
    EXPECT_EQ(stats.top_k_profit, 1);
    EXPECT_DOUBLE_EQ(stats.profit_share_top, 1.0);
}

TEST_F(DistributionAnalyzerTest, TopCountRoundsUp) {
    EXPECT_EQ(DistributionAnalyzer::top_count(10.0, 20), 2);
    EXPECT_EQ(DistributionAnalyzer::top_count(10.0, 5), 1);
    EXPECT_EQ(DistributionAnalyzer::top_count(30.0, 7), 3);
    EXPECT_EQ(DistributionAnalyzer::top_count(5.0, 1), 1);
    EXPECT_EQ(DistributionAnalyzer::top_count(10.0, 0), 0);
}

TEST_F(DistributionAnalyzerTest, StabilityScore) {
    EXPECT_DOUBLE_EQ(DistributionAnalyzer::stability_score(0.0, {}), 100.0);
    // Equal winners have no dispersion
    EXPECT_NEAR(DistributionAnalyzer::stability_score(1.0 / 3.0, {10, 10, 10}), 80.0, 1e-9);
    EXPECT_LT(DistributionAnalyzer::stability_score(0.9, {1, 1, 1, 500}), 50.0);
}

TEST_F(DistributionAnalyzerTest, HistogramBinsCoverRange) {
    DistributionAnalyzer two_bins(2);
    auto bins = two_bins.build_histogram({0.0, 4.0, 10.0});
    ASSERT_EQ(bins.size(), 2u);
    EXPECT_DOUBLE_EQ(bins[0].bin_start, 0.0);
    EXPECT_DOUBLE_EQ(bins[0].bin_end, 5.0);
    EXPECT_EQ(bins[0].count, 2);
    EXPECT_DOUBLE_EQ(bins[0].total_pnl, 4.0);
    EXPECT_DOUBLE_EQ(bins[1].bin_end, 10.0);
    EXPECT_EQ(bins[1].count, 1);

    auto full = analyzer.build_histogram({-30, -5, 0, 12, 40, 41});
    ASSERT_EQ(full.size(), 20u);
    int total = 0;
    for (const auto& bin : full) {
        total += bin.count;
    }
    EXPECT_EQ(total, 6);
}

TEST_F(DistributionAnalyzerTest, ExtremeRangesKeepMaximumInLastBin) {
    const double tiny = std::numeric_limits<double>::denorm_min();
    auto subnormal = analyzer.build_histogram({0.0, tiny});
    ASSERT_EQ(subnormal.size(), 20u);
    EXPECT_EQ(subnormal.front().count, 1);
    EXPECT_EQ(subnormal.back().count, 1);
    EXPECT_DOUBLE_EQ(subnormal.back().bin_end, tiny);

    const double huge = std::numeric_limits<double>::max();
    auto wide = analyzer.build_histogram({-huge, 0.0, huge});
    ASSERT_EQ(wide.size(), 20u);
    EXPECT_EQ(wide.front().count, 1);
    EXPECT_EQ(wide[10].count, 1);
    EXPECT_EQ(wide.back().count, 1);
    for (const auto& bin : wide) {
        EXPECT_TRUE(std::isfinite(bin.bin_start));
        EXPECT_TRUE(std::isfinite(bin.bin_end));
    }
}

TEST_F(DistributionAnalyzerTest, IdenticalValuesMakeSingleBin) {
    auto bins = analyzer.build_histogram({5.0, 5.0, 5.0});
    ASSERT_EQ(bins.size(), 1u);
    EXPECT_EQ(bins[0].count, 3);
    EXPECT_DOUBLE_EQ(bins[0].total_pnl, 15.0);
}
