// tests/analytics/test_tilt_analyzer.cpp
#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "trade_journal/analytics/tilt_analyzer.hpp"

using namespace trade_journal;
using trade_journal::testing::create_pair_series;

class TiltAnalyzerTest : public ::testing::Test {
protected:
    // Six winners, then six losers that grow in size
    std::vector<PairedTrade> losing_spiral() const {
        return create_pair_series({100, 100, 100, 100, 100, 100, -10, -20, -30, -40, -50, -60});
    }
};

TEST_F(TiltAnalyzerTest, TooFewTradesIsInsufficient) {
    TiltAnalyzer analyzer;
    auto stats = analyzer.analyze(create_pair_series({10, -10, 10, -10, 10}));
    EXPECT_EQ(stats.total_trades, 5);
    EXPECT_EQ(stats.tilt_category, TiltAnalyzer::CATEGORY_INSUFFICIENT);
    EXPECT_DOUBLE_EQ(stats.tilt_score, 0.0);
    EXPECT_DOUBLE_EQ(stats.baseline_win_rate, 0.6);
    EXPECT_EQ(stats.streak_stats.size(), 4u);
    EXPECT_FALSE(stats.recommended_streak.has_value());
    ASSERT_EQ(stats.coaching_lines.size(), 1u);
}

TEST_F(TiltAnalyzerTest, SmallHistoryStillReportsBaselineAndStreakSamples) {
    // 3 wins then 6 losses
    auto stats = TiltAnalyzer().analyze(create_pair_series({10, 10, 10, -5, -5, -5, -5, -5, -5}));
    EXPECT_EQ(stats.total_trades, 9);
    EXPECT_EQ(stats.tilt_category, TiltAnalyzer::CATEGORY_INSUFFICIENT);
    EXPECT_DOUBLE_EQ(stats.baseline_win_rate, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(stats.baseline_loss_rate, 2.0 / 3.0);

    ASSERT_EQ(stats.streak_stats.size(), 4u);
    EXPECT_EQ(stats.streak_stats[0].sample_size, 5);
    EXPECT_EQ(stats.streak_stats[1].sample_size, 4);
    EXPECT_EQ(stats.streak_stats[3].sample_size, 2);
    EXPECT_DOUBLE_EQ(stats.streak_stats[0].win_rate_after_k_losses, 0.0);
    EXPECT_FALSE(stats.streak_stats[0].sufficient_sample);
    EXPECT_FALSE(stats.recommended_streak.has_value());
}

TEST_F(TiltAnalyzerTest, AlternatingResultsAreCalm) {
    std::vector<double> pnls;
    for (int i = 0; i < 10; ++i) {
        pnls.push_back(50);
        pnls.push_back(-25);
    }
    auto stats = TiltAnalyzer().analyze(create_pair_series(pnls));

    EXPECT_DOUBLE_EQ(stats.baseline_win_rate, 0.5);
    EXPECT_DOUBLE_EQ(stats.win_rate_after_loss, 1.0);
    EXPECT_DOUBLE_EQ(stats.win_rate_after_win, 0.0);
    EXPECT_DOUBLE_EQ(stats.prob_loss_after_loss, 0.0);
    EXPECT_DOUBLE_EQ(stats.tilt_score, 0.0);
    EXPECT_EQ(stats.tilt_category, TiltAnalyzer::CATEGORY_CALM);
    EXPECT_FALSE(stats.recommended_streak.has_value());
    EXPECT_FALSE(stats.coaching_lines.empty());
}

TEST_F(TiltAnalyzerTest, LosingSpiralIsHighTilt) {
    TiltOptions options;
    options.min_sample = 3;
    auto stats = TiltAnalyzer(options).analyze(losing_spiral());

    EXPECT_DOUBLE_EQ(stats.baseline_win_rate, 0.5);
    EXPECT_DOUBLE_EQ(stats.win_rate_after_loss, 0.0);
    EXPECT_DOUBLE_EQ(stats.prob_loss_after_loss, 1.0);
    EXPECT_DOUBLE_EQ(stats.avg_loss_normally, -35.0);
    EXPECT_DOUBLE_EQ(stats.avg_loss_after_loss, -40.0);
    EXPECT_NEAR(stats.tilt_score, 4.0 + 3.0 * (40.0 / 35.0 - 1.0) + 3.0, 1e-9);
    EXPECT_EQ(stats.tilt_category, TiltAnalyzer::CATEGORY_HIGH);
    EXPECT_EQ(stats.recommended_streak, std::optional<int>(1));
}

TEST_F(TiltAnalyzerTest, StreakStatsCountTradesAfterAtLeastKLosses) {
    TiltOptions options;
    options.min_sample = 3;
    auto stats = TiltAnalyzer(options).analyze(losing_spiral());

    ASSERT_EQ(stats.streak_stats.size(), 4u);
    EXPECT_EQ(stats.streak_stats[0].k, 1);
    EXPECT_EQ(stats.streak_stats[0].sample_size, 5);
    EXPECT_EQ(stats.streak_stats[1].sample_size, 4);
    EXPECT_EQ(stats.streak_stats[2].sample_size, 3);
    EXPECT_EQ(stats.streak_stats[3].sample_size, 2);
    EXPECT_TRUE(stats.streak_stats[2].sufficient_sample);
    EXPECT_FALSE(stats.streak_stats[3].sufficient_sample);
    EXPECT_DOUBLE_EQ(stats.streak_stats[3].avg_pnl_after_k_losses, -55.0);
}

TEST_F(TiltAnalyzerTest, SmallSamplesNeverRecommendAStreak) {
    auto stats = TiltAnalyzer().analyze(losing_spiral());
    EXPECT_FALSE(stats.recommended_streak.has_value());
    for (const auto& streak : stats.streak_stats) {
        EXPECT_FALSE(streak.sufficient_sample);
    }
}

TEST_F(TiltAnalyzerTest, BreakevenEndsLossSequence) {
    auto stats = TiltAnalyzer().analyze(create_pair_series({-10, 0, 10, -10, 0, 10, -10, 0, 10, 10}));
    EXPECT_EQ(stats.total_trades, 10);
    EXPECT_NEAR(stats.baseline_win_rate, 4.0 / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats.win_rate_after_loss, stats.baseline_win_rate);
    EXPECT_DOUBLE_EQ(stats.prob_loss_after_loss, 0.0);
    EXPECT_EQ(stats.streak_stats[0].sample_size, 0);
    EXPECT_DOUBLE_EQ(stats.tilt_score, 0.0);
}

TEST_F(TiltAnalyzerTest, Categorize) {
    EXPECT_EQ(TiltAnalyzer::categorize(0.0), TiltAnalyzer::CATEGORY_CALM);
    EXPECT_EQ(TiltAnalyzer::categorize(3.0), TiltAnalyzer::CATEGORY_CALM);
    EXPECT_EQ(TiltAnalyzer::categorize(3.01), TiltAnalyzer::CATEGORY_MODERATE);
    EXPECT_EQ(TiltAnalyzer::categorize(7.0), TiltAnalyzer::CATEGORY_MODERATE);
    EXPECT_EQ(TiltAnalyzer::categorize(7.5), TiltAnalyzer::CATEGORY_HIGH);
}
