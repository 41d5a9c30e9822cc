// tests/analytics/test_metrics_calculator.cpp
#include <gtest/gtest.h>
#include <cmath>
#include "test_utils.hpp"
#include "trade_journal/analytics/metrics_calculator.hpp"

using namespace trade_journal;
using trade_journal::testing::at;
using trade_journal::testing::create_pair;
using trade_journal::testing::create_pair_series;

class MetricsCalculatorTest : public ::testing::Test {
protected:
    MetricsCalculator calculator;
};

TEST_F(MetricsCalculatorTest, EmptyInputGivesZeroes) {
    Metrics m = calculator.calculate({}, {});
    EXPECT_EQ(m.total_trades, 0);
    EXPECT_DOUBLE_EQ(m.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(m.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(m.expectancy, 0.0);
    EXPECT_DOUBLE_EQ(m.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(m.max_drawdown, 0.0);
    EXPECT_EQ(m.trading_days, 0);
    EXPECT_TRUE(m.best_day_date.empty());
    EXPECT_DOUBLE_EQ(m.strategy_win_rate, 0.0);
}

TEST_F(MetricsCalculatorTest, CoreRatios) {
    Metrics m = calculator.calculate(create_pair_series({300, 200, -150, -50}), {});

    EXPECT_EQ(m.total_trades, 4);
    EXPECT_EQ(m.winning_trades, 2);
    EXPECT_EQ(m.losing_trades, 2);
    EXPECT_DOUBLE_EQ(m.win_rate, 0.5);
    EXPECT_DOUBLE_EQ(m.gross_profit, 500.0);
    EXPECT_DOUBLE_EQ(m.gross_loss, -200.0);
    EXPECT_DOUBLE_EQ(m.profit_factor, 2.5);
    EXPECT_DOUBLE_EQ(m.average_profit, 250.0);
    EXPECT_DOUBLE_EQ(m.average_loss, -100.0);
    EXPECT_DOUBLE_EQ(m.risk_reward_ratio, 2.5);
    EXPECT_DOUBLE_EQ(m.expectancy, 75.0);
    EXPECT_DOUBLE_EQ(m.average_trade, 75.0);
    EXPECT_DOUBLE_EQ(m.net_profit, 300.0);
    EXPECT_DOUBLE_EQ(m.largest_win, 300.0);
    EXPECT_DOUBLE_EQ(m.largest_loss, -150.0);
    EXPECT_DOUBLE_EQ(m.average_holding_time_seconds, 3600.0);
    EXPECT_DOUBLE_EQ(m.total_volume, 400.0);
}

TEST_F(MetricsCalculatorTest, SentinelWhenNoLosses) {
    Metrics winners_only = calculator.calculate(create_pair_series({10, 20}), {});
    EXPECT_DOUBLE_EQ(winners_only.profit_factor, RATIO_SENTINEL);
    EXPECT_DOUBLE_EQ(winners_only.risk_reward_ratio, RATIO_SENTINEL);
    EXPECT_TRUE(std::isfinite(winners_only.sharpe_ratio));

    Metrics losers_only = calculator.calculate(create_pair_series({-10, -20}), {});
    EXPECT_DOUBLE_EQ(losers_only.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(losers_only.risk_reward_ratio, 0.0);
}

TEST_F(MetricsCalculatorTest, MaxDrawdownFromRunningPeak) {
    auto pairs = create_pair_series({100, -50, -70, 200, -30});
    EXPECT_DOUBLE_EQ(calculator.calculate_max_drawdown(pairs), 120.0);

    // A losing first trade is already a drawdown from zero
    EXPECT_DOUBLE_EQ(calculator.calculate_max_drawdown(create_pair_series({-40, 10})), 40.0);
}

TEST_F(MetricsCalculatorTest, StreaksIgnoreBreakeven) {
    auto streaks = calculator.calculate_streaks(create_pair_series({10, 20, 0, 30, -5, -5, 10}));
    EXPECT_EQ(streaks.longest_wins, 3);
    EXPECT_EQ(streaks.longest_losses, 2);
    EXPECT_EQ(streaks.current_wins, 1);
    EXPECT_EQ(streaks.current_losses, 0);
}

TEST_F(MetricsCalculatorTest, DailySeriesAndSharpe) {
    Metrics m = calculator.calculate(create_pair_series({300, 200, -150, -50}), {});
    EXPECT_EQ(m.trading_days, 4);
    EXPECT_DOUBLE_EQ(m.trades_per_day, 1.0);
    EXPECT_DOUBLE_EQ(m.best_day, 300.0);
    EXPECT_EQ(m.best_day_date, "2024-01-01");
    EXPECT_DOUBLE_EQ(m.worst_day, -150.0);
    EXPECT_EQ(m.worst_day_date, "2024-01-03");
    EXPECT_NEAR(m.sharpe_ratio, 75.0 / std::sqrt(132500.0 / 3.0), 1e-12);

    // One trading day has no dispersion
    Metrics single = calculator.calculate(create_pair_series({50}), {});
    EXPECT_DOUBLE_EQ(single.sharpe_ratio, 0.0);
}

TEST_F(MetricsCalculatorTest, SameDayPairsShareOneDailyEntry) {
    std::vector<PairedTrade> pairs = {create_pair(10, at(2024, 3, 1, 14)),
                                      create_pair(-4, at(2024, 3, 1, 18)),
                                      create_pair(7, at(2024, 3, 4, 15))};
    auto daily = calculator.calculate_daily_pnl(pairs);
    ASSERT_EQ(daily.size(), 2u);
    EXPECT_EQ(daily[0].date, "2024-03-01");
    EXPECT_DOUBLE_EQ(daily[0].net_pnl, 6.0);
    EXPECT_EQ(daily[0].trade_count, 2);
    EXPECT_EQ(daily[1].date, "2024-03-04");
}

TEST_F(MetricsCalculatorTest, PercentReturnsFollowDirection) {
    PairedTrade short_pair = create_pair(0, at(2024, 3, 1, 15));
    short_pair.direction = TradeDirection::SHORT;
    short_pair.entry_price = 50.0;
    short_pair.exit_price = 45.0;
    EXPECT_DOUBLE_EQ(MetricsCalculator::return_pct(short_pair), 10.0);

    Metrics m = calculator.calculate(create_pair_series({10, -5}), {});
    EXPECT_DOUBLE_EQ(m.average_gain_pct, 10.0);
    EXPECT_DOUBLE_EQ(m.largest_loss_pct, -5.0);
}

TEST_F(MetricsCalculatorTest, StrategyFieldsUseTheirOwnPairSet) {
    auto ranged = create_pair_series({100, -20});
    std::vector<PairedTrade> all_time = {create_pair(50, at(2023, 6, 1, 15), "AAPL", 1),
                                         create_pair(60, at(2023, 6, 2, 15), "AAPL", 1),
                                         create_pair(-30, at(2024, 1, 2, 15), "AAPL", 2),
                                         create_pair(999, at(2024, 1, 3, 15))};

    Metrics m = calculator.calculate(ranged, all_time);
    EXPECT_EQ(m.total_trades, 2);
    EXPECT_DOUBLE_EQ(m.net_profit, 80.0);

    EXPECT_EQ(m.strategy_winning_trades, 2);
    EXPECT_EQ(m.strategy_losing_trades, 1);
    EXPECT_DOUBLE_EQ(m.strategy_profit_loss, 80.0);
    EXPECT_NEAR(m.strategy_win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_EQ(m.strategy_consecutive_wins, 2);
    EXPECT_EQ(m.strategy_consecutive_losses, 1);
}

TEST_F(MetricsCalculatorTest, StrategyWinRateSkipsBreakeven) {
    std::vector<PairedTrade> attributed = {create_pair(40, at(2024, 1, 2, 15), "AAPL", 1),
                                           create_pair(0, at(2024, 1, 3, 15), "AAPL", 1),
                                           create_pair(0, at(2024, 1, 4, 15), "AAPL", 2),
                                           create_pair(-10, at(2024, 1, 5, 15), "AAPL", 2)};

    Metrics m = calculator.calculate({}, attributed);
    EXPECT_EQ(m.strategy_winning_trades, 1);
    EXPECT_EQ(m.strategy_losing_trades, 1);
    EXPECT_DOUBLE_EQ(m.strategy_win_rate, 0.5);
    EXPECT_DOUBLE_EQ(m.strategy_profit_loss, 30.0);

    Metrics flat = calculator.calculate({}, {create_pair(0, at(2024, 1, 2, 15), "AAPL", 1)});
    EXPECT_DOUBLE_EQ(flat.strategy_win_rate, 0.0);
}

TEST_F(MetricsCalculatorTest, CalculationIsIdempotent) {
    auto pairs = create_pair_series({12.5, -3.25, 7, 0, -9});
    Metrics first = calculator.calculate(pairs, pairs);
    Metrics second = calculator.calculate(pairs, pairs);
    EXPECT_EQ(first.net_profit, second.net_profit);
    EXPECT_EQ(first.sharpe_ratio, second.sharpe_ratio);
    EXPECT_EQ(first.max_drawdown, second.max_drawdown);
    EXPECT_EQ(first.breakeven_trades, 1);
}

TEST_F(MetricsCalculatorTest, SessionOffsetMovesDayBoundary) {
    MetricsCalculator eastern(-300);
    std::vector<PairedTrade> pairs = {create_pair(10, at(2024, 3, 2, 2))};
    auto daily = eastern.calculate_daily_pnl(pairs);
    ASSERT_EQ(daily.size(), 1u);
    EXPECT_EQ(daily[0].date, "2024-03-01");
}
