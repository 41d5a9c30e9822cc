// include/trade_journal/analytics/metrics_calculator.hpp
#pragma once

#include <string>
#include <vector>
#include "trade_journal/core/types.hpp"
#include "trade_journal/pairing/lot_matcher.hpp"

namespace trade_journal {

/**
 * @brief Value reported for profit factor and payoff ratios when there are
 * winners but no losers
 */
constexpr double RATIO_SENTINEL = 999.0;

/**
 * @brief Net P&L of all pairs closed on one calendar day
 */
struct DailyPnl {
    std::string date;  // YYYY-MM-DD
    double net_pnl = 0.0;
    int trade_count = 0;
};

struct StreakSummary {
    int longest_wins = 0;
    int longest_losses = 0;
    int current_wins = 0;
    int current_losses = 0;
};

/**
 * @brief Portfolio-level performance over a set of closed pairs
 */
struct Metrics {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    int breakeven_trades = 0;
    double win_rate = 0.0;  // 0..1
    double average_profit = 0.0;
    double average_loss = 0.0;  // Negative or 0
    double largest_win = 0.0;
    double largest_loss = 0.0;
    double total_volume = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;  // Negative or 0
    double profit_factor = 0.0;
    double expectancy = 0.0;
    double average_trade = 0.0;
    double total_fees = 0.0;
    double net_profit = 0.0;
    double max_drawdown = 0.0;
    double sharpe_ratio = 0.0;
    double risk_reward_ratio = 0.0;
    double trades_per_day = 0.0;
    int trading_days = 0;
    double best_day = 0.0;
    std::string best_day_date;
    double worst_day = 0.0;
    std::string worst_day_date;
    int consecutive_wins = 0;
    int consecutive_losses = 0;
    int current_win_streak = 0;
    int current_loss_streak = 0;
    double average_holding_time_seconds = 0.0;
    double average_gain_pct = 0.0;
    double average_loss_pct = 0.0;
    double largest_win_pct = 0.0;
    double largest_loss_pct = 0.0;

    // Over pairs attributed to a strategy
    double strategy_win_rate = 0.0;  // Winners over winners plus losers
    int strategy_winning_trades = 0;
    int strategy_losing_trades = 0;
    double strategy_profit_loss = 0.0;
    int strategy_consecutive_wins = 0;
    int strategy_consecutive_losses = 0;
};

/**
 * @brief Pure stateless calculator for portfolio metrics
 *
 * All methods are const and have no side effects. Ratios are guarded so
 * that no NaN or infinity reaches the caller: empty inputs give 0, and a
 * ratio with winners but no losers gives RATIO_SENTINEL.
 */
class MetricsCalculator {
public:
    /**
     * @param session_utc_offset_minutes Offset used to assign exits to calendar days
     */
    explicit MetricsCalculator(int session_utc_offset_minutes = 0);

    // ========== Composite Calculation ==========

    /**
     * @brief Calculate every metric
     * @param pairs Pairs inside the requested date range
     * @param strategy_pairs Pairs used for the strategy_* fields; those
     *        without a strategy are ignored
     */
    Metrics calculate(const std::vector<PairedTrade>& pairs,
                      const std::vector<PairedTrade>& strategy_pairs) const;

    // ========== Series ==========

    /**
     * @brief Net P&L per exit day, in date order
     */
    std::vector<DailyPnl> calculate_daily_pnl(const std::vector<PairedTrade>& pairs) const;

    /**
     * @brief Largest decline of cumulative net P&L from a running peak that starts at 0
     * @return Drawdown as a positive amount
     */
    double calculate_max_drawdown(const std::vector<PairedTrade>& pairs) const;

    /**
     * @brief mean / sample stddev of daily net P&L, not annualized
     */
    double calculate_sharpe_ratio(const std::vector<DailyPnl>& daily) const;

    /**
     * @brief Win and loss streaks in exit order; breakeven pairs neither extend nor break a streak
     */
    StreakSummary calculate_streaks(const std::vector<PairedTrade>& pairs) const;

    // ========== Ratios ==========

    static double profit_factor(double gross_profit, double gross_loss);
    static double payoff_ratio(double average_win, double average_loss, int winners, int losers);

    /**
     * @brief Percent price move in the trade's favor
     */
    static double return_pct(const PairedTrade& pair);

    /**
     * @brief Stable sort by exit time; pairs with the same exit keep matching order
     */
    static std::vector<PairedTrade> sort_by_exit(std::vector<PairedTrade> pairs);

private:
    int session_utc_offset_minutes_;
};

}  // namespace trade_journal
