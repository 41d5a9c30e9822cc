// src/analytics/equity_curve_builder.cpp
#include "trade_journal/analytics/equity_curve_builder.hpp"
#include <algorithm>

namespace trade_journal {

EquityCurveBuilder::EquityCurveBuilder(int session_utc_offset_minutes)
    : session_utc_offset_minutes_(session_utc_offset_minutes) {}

EquityCurve EquityCurveBuilder::build(const std::vector<PairedTrade>& pairs) const {
    MetricsCalculator calculator(session_utc_offset_minutes_);
    return build_from_daily(calculator.calculate_daily_pnl(pairs));
}

EquityCurve EquityCurveBuilder::build_from_daily(const std::vector<DailyPnl>& daily) const {
    EquityCurve curve;
    if (daily.empty()) {
        return curve;
    }

    DrawdownMetrics& dd = curve.drawdown;
    EquitySurge& surge = curve.best_surge;

    double cumulative = 0.0;
    double peak = 0.0;
    std::string peak_date = daily.front().date;
    double peak_at_max_drawdown = 0.0;

    double trough = 0.0;
    std::string trough_date = daily.front().date;

    double drawdown_sum = 0.0;
    int drawdown_days = 0;
    int run_days = 0;
    std::string run_start;

    size_t max_start_index = 0;
    size_t max_end_index = 0;
    size_t surge_start_index = 0;
    size_t surge_end_index = 0;
    size_t trough_index = 0;
    size_t peak_index = 0;

    for (size_t i = 0; i < daily.size(); ++i) {
        const DailyPnl& day = daily[i];
        cumulative += day.net_pnl;

        if (cumulative > peak) {
            peak = cumulative;
            peak_date = day.date;
            peak_index = i;
        }

        EquityPoint point;
        point.date = day.date;
        point.daily_pnl = day.net_pnl;
        point.cumulative_pnl = cumulative;
        point.peak_equity = peak;
        point.drawdown = peak - cumulative;
        point.drawdown_pct = peak > 0.0 ? point.drawdown / peak * 100.0 : 0.0;

        // ========== Drawdown ==========

        if (point.drawdown > dd.max_drawdown) {
            dd.max_drawdown = point.drawdown;
            dd.max_drawdown_start = peak_date;
            dd.max_drawdown_end = day.date;
            peak_at_max_drawdown = peak;
            max_start_index = peak_index;
            max_end_index = i;
        }

        if (point.drawdown > 0.0) {
            drawdown_sum += point.drawdown;
            drawdown_days++;
            if (run_days == 0) {
                run_start = day.date;
            }
            run_days++;
            if (run_days > dd.longest_drawdown_days) {
                dd.longest_drawdown_days = run_days;
                dd.longest_drawdown_start = run_start;
                dd.longest_drawdown_end = day.date;
            }
        } else {
            run_days = 0;
        }

        // ========== Surge ==========

        if (cumulative - trough > surge.value) {
            surge.value = cumulative - trough;
            surge.start = trough_date;
            surge.end = day.date;
            surge_start_index = trough_index;
            surge_end_index = i;
        }
        if (cumulative < trough) {
            trough = cumulative;
            trough_date = day.date;
            trough_index = i;
        }

        curve.points.push_back(point);
    }

    dd.avg_drawdown = drawdown_days > 0 ? drawdown_sum / drawdown_days : 0.0;
    dd.max_drawdown_pct = peak_at_max_drawdown > 0.0 ? dd.max_drawdown / peak_at_max_drawdown * 100.0
                                                     : 0.0;

    if (dd.max_drawdown > 0.0) {
        for (size_t i = max_start_index; i <= max_end_index; ++i) {
            curve.points[i].is_max_drawdown = true;
        }
    }
    if (surge.value > 0.0) {
        for (size_t i = surge_start_index; i <= surge_end_index; ++i) {
            curve.points[i].is_best_surge = true;
        }
    }

    return curve;
}

}  // namespace trade_journal
