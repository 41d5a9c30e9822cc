// include/trade_journal/analytics/equity_curve_builder.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "trade_journal/analytics/metrics_calculator.hpp"
#include "trade_journal/pairing/lot_matcher.hpp"

namespace trade_journal {

/**
 * @brief One trading day on the cumulative net P&L curve
 */
struct EquityPoint {
    std::string date;
    double daily_pnl = 0.0;
    double cumulative_pnl = 0.0;
    double peak_equity = 0.0;
    double drawdown = 0.0;      // peak_equity - cumulative_pnl
    double drawdown_pct = 0.0;  // Percent of peak_equity, 0 while the peak is not positive
    bool is_max_drawdown = false;
    bool is_best_surge = false;
};

struct DrawdownMetrics {
    double max_drawdown = 0.0;
    double max_drawdown_pct = 0.0;
    std::optional<std::string> max_drawdown_start;  // Date of the peak
    std::optional<std::string> max_drawdown_end;    // Date of the trough
    double avg_drawdown = 0.0;                      // Over days below the peak
    int longest_drawdown_days = 0;
    std::optional<std::string> longest_drawdown_start;
    std::optional<std::string> longest_drawdown_end;
};

/**
 * @brief Largest rise from a trough to a later day
 */
struct EquitySurge {
    double value = 0.0;
    std::optional<std::string> start;
    std::optional<std::string> end;
};

struct EquityCurve {
    std::vector<EquityPoint> points;
    DrawdownMetrics drawdown;
    EquitySurge best_surge;
};

/**
 * @brief Builds the daily equity curve of a pair set
 *
 * Equity starts at 0 before the first day, so a losing first day is
 * already a drawdown.
 */
class EquityCurveBuilder {
public:
    explicit EquityCurveBuilder(int session_utc_offset_minutes = 0);

    EquityCurve build(const std::vector<PairedTrade>& pairs) const;

    EquityCurve build_from_daily(const std::vector<DailyPnl>& daily) const;

private:
    int session_utc_offset_minutes_;
};

}  // namespace trade_journal
