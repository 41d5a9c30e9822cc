// src/analytics/metrics_calculator.cpp
#include "trade_journal/analytics/metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include "trade_journal/analytics/statistics_utils.hpp"
#include "trade_journal/core/time_utils.hpp"

namespace trade_journal {

MetricsCalculator::MetricsCalculator(int session_utc_offset_minutes)
    : session_utc_offset_minutes_(session_utc_offset_minutes) {}

// ========== Composite Calculation ==========

Metrics MetricsCalculator::calculate(const std::vector<PairedTrade>& pairs,
                                     const std::vector<PairedTrade>& strategy_pairs) const {
    Metrics m;
    const std::vector<PairedTrade> ordered = sort_by_exit(pairs);

    std::vector<double> win_pcts;
    std::vector<double> loss_pcts;
    double holding_seconds = 0.0;

    for (const auto& pair : ordered) {
        m.total_trades++;
        m.net_profit += pair.net_pnl;
        m.total_fees += pair.total_fees();
        m.total_volume += pair.quantity * pair.entry_price;
        holding_seconds +=
            std::chrono::duration<double>(pair.exit_timestamp - pair.entry_timestamp).count();

        if (pair.net_pnl > 0.0) {
            m.winning_trades++;
            m.gross_profit += pair.net_pnl;
            m.largest_win = std::max(m.largest_win, pair.net_pnl);
            win_pcts.push_back(return_pct(pair));
        } else if (pair.net_pnl < 0.0) {
            m.losing_trades++;
            m.gross_loss += pair.net_pnl;
            m.largest_loss = std::min(m.largest_loss, pair.net_pnl);
            loss_pcts.push_back(return_pct(pair));
        } else {
            m.breakeven_trades++;
        }
    }

    m.win_rate = statistics::safe_divide(m.winning_trades, m.total_trades);
    m.average_profit = statistics::safe_divide(m.gross_profit, m.winning_trades);
    m.average_loss = statistics::safe_divide(m.gross_loss, m.losing_trades);
    m.average_trade = statistics::safe_divide(m.net_profit, m.total_trades);
    m.profit_factor = profit_factor(m.gross_profit, m.gross_loss);
    m.risk_reward_ratio =
        payoff_ratio(m.average_profit, m.average_loss, m.winning_trades, m.losing_trades);
    m.expectancy = m.total_trades > 0
                       ? m.win_rate * m.average_profit + (1.0 - m.win_rate) * m.average_loss
                       : 0.0;
    m.average_holding_time_seconds = statistics::safe_divide(holding_seconds, m.total_trades);

    m.average_gain_pct = statistics::mean(win_pcts);
    m.average_loss_pct = statistics::mean(loss_pcts);
    if (!win_pcts.empty()) {
        m.largest_win_pct = *std::max_element(win_pcts.begin(), win_pcts.end());
    }
    if (!loss_pcts.empty()) {
        m.largest_loss_pct = *std::min_element(loss_pcts.begin(), loss_pcts.end());
    }

    m.max_drawdown = calculate_max_drawdown(ordered);

    const auto daily = calculate_daily_pnl(ordered);
    m.trading_days = static_cast<int>(daily.size());
    m.trades_per_day = statistics::safe_divide(m.total_trades, m.trading_days);
    m.sharpe_ratio = calculate_sharpe_ratio(daily);
    if (!daily.empty()) {
        auto [worst, best] = std::minmax_element(
            daily.begin(), daily.end(),
            [](const DailyPnl& a, const DailyPnl& b) { return a.net_pnl < b.net_pnl; });
        m.best_day = best->net_pnl;
        m.best_day_date = best->date;
        m.worst_day = worst->net_pnl;
        m.worst_day_date = worst->date;
    }

    const StreakSummary streaks = calculate_streaks(ordered);
    m.consecutive_wins = streaks.longest_wins;
    m.consecutive_losses = streaks.longest_losses;
    m.current_win_streak = streaks.current_wins;
    m.current_loss_streak = streaks.current_losses;

    // ========== Strategy Fields ==========

    std::vector<PairedTrade> attributed;
    for (const auto& pair : strategy_pairs) {
        if (pair.strategy_id) {
            attributed.push_back(pair);
        }
    }
    attributed = sort_by_exit(std::move(attributed));

    for (const auto& pair : attributed) {
        m.strategy_profit_loss += pair.net_pnl;
        if (pair.net_pnl > 0.0) {
            m.strategy_winning_trades++;
        } else if (pair.net_pnl < 0.0) {
            m.strategy_losing_trades++;
        }
    }
    // Breakeven pairs count toward strategy P&L but not toward its win rate
    m.strategy_win_rate = statistics::safe_divide(
        m.strategy_winning_trades, m.strategy_winning_trades + m.strategy_losing_trades);
    const StreakSummary strategy_streaks = calculate_streaks(attributed);
    m.strategy_consecutive_wins = strategy_streaks.longest_wins;
    m.strategy_consecutive_losses = strategy_streaks.longest_losses;

    return m;
}

// ========== Series ==========

std::vector<DailyPnl> MetricsCalculator::calculate_daily_pnl(
    const std::vector<PairedTrade>& pairs) const {
    std::map<std::string, DailyPnl> by_date;
    for (const auto& pair : pairs) {
        const std::string date = core::format_date(pair.exit_timestamp, session_utc_offset_minutes_);
        DailyPnl& day = by_date[date];
        day.date = date;
        day.net_pnl += pair.net_pnl;
        day.trade_count++;
    }

    std::vector<DailyPnl> daily;
    daily.reserve(by_date.size());
    for (const auto& [date, day] : by_date) {
        daily.push_back(day);
    }
    return daily;
}

double MetricsCalculator::calculate_max_drawdown(const std::vector<PairedTrade>& pairs) const {
    double cumulative = 0.0;
    double peak = 0.0;
    double max_drawdown = 0.0;
    for (const auto& pair : sort_by_exit(pairs)) {
        cumulative += pair.net_pnl;
        peak = std::max(peak, cumulative);
        max_drawdown = std::max(max_drawdown, peak - cumulative);
    }
    return max_drawdown;
}

double MetricsCalculator::calculate_sharpe_ratio(const std::vector<DailyPnl>& daily) const {
    if (daily.size() < 2) {
        return 0.0;
    }

    std::vector<double> values;
    values.reserve(daily.size());
    for (const auto& day : daily) {
        values.push_back(day.net_pnl);
    }

    const double stddev = statistics::sample_stddev(values);
    if (stddev <= 0.0) {
        return 0.0;
    }
    return statistics::mean(values) / stddev;
}

StreakSummary MetricsCalculator::calculate_streaks(const std::vector<PairedTrade>& pairs) const {
    StreakSummary s;
    for (const auto& pair : pairs) {
        if (pair.net_pnl > 0.0) {
            s.current_wins++;
            s.current_losses = 0;
        } else if (pair.net_pnl < 0.0) {
            s.current_losses++;
            s.current_wins = 0;
        }
        s.longest_wins = std::max(s.longest_wins, s.current_wins);
        s.longest_losses = std::max(s.longest_losses, s.current_losses);
    }
    return s;
}

// ========== Ratios ==========

double MetricsCalculator::profit_factor(double gross_profit, double gross_loss) {
    if (gross_loss == 0.0) {
        return gross_profit > 0.0 ? RATIO_SENTINEL : 0.0;
    }
    return gross_profit / std::abs(gross_loss);
}

double MetricsCalculator::payoff_ratio(double average_win, double average_loss, int winners,
                                       int losers) {
    if (losers == 0 || average_loss == 0.0) {
        return winners > 0 ? RATIO_SENTINEL : 0.0;
    }
    return std::abs(average_win / average_loss);
}

double MetricsCalculator::return_pct(const PairedTrade& pair) {
    if (pair.entry_price <= 0.0) {
        return 0.0;
    }
    const double sign = pair.direction == TradeDirection::LONG ? 1.0 : -1.0;
    return (pair.exit_price - pair.entry_price) / pair.entry_price * 100.0 * sign;
}

std::vector<PairedTrade> MetricsCalculator::sort_by_exit(std::vector<PairedTrade> pairs) {
    std::stable_sort(pairs.begin(), pairs.end(), [](const PairedTrade& a, const PairedTrade& b) {
        return a.exit_timestamp < b.exit_timestamp;
    });
    return pairs;
}

}  // namespace trade_journal
