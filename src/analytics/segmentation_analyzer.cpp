// src/analytics/segmentation_analyzer.cpp
#include "trade_journal/analytics/segmentation_analyzer.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <map>
#include "trade_journal/analytics/metrics_calculator.hpp"
#include "trade_journal/analytics/statistics_utils.hpp"
#include "trade_journal/core/time_utils.hpp"
#include "trade_journal/instruments/option_symbol.hpp"

namespace trade_journal {

namespace {

template <typename Segment>
void sort_by_total_pnl(std::vector<Segment>& segments,
                       std::string (*name_of)(const Segment&)) {
    std::sort(segments.begin(), segments.end(), [name_of](const Segment& a, const Segment& b) {
        if (a.stats.total_pnl != b.stats.total_pnl) {
            return a.stats.total_pnl > b.stats.total_pnl;
        }
        return name_of(a) < name_of(b);
    });
}

std::string symbol_name(const SymbolSegment& segment) {
    return segment.symbol;
}

std::string strategy_name(const StrategySegment& segment) {
    return segment.strategy_name;
}

}  // namespace

SegmentationAnalyzer::SegmentationAnalyzer(int session_utc_offset_minutes)
    : session_utc_offset_minutes_(session_utc_offset_minutes) {}

EvaluationMetrics SegmentationAnalyzer::analyze(
    const std::vector<PairedTrade>& pairs,
    const std::unordered_map<StrategyId, std::string>& strategy_names) const {
    std::array<std::vector<double>, 7> weekday_pnls;
    std::array<std::vector<double>, 31> day_pnls;
    std::array<std::vector<double>, 24> hour_pnls;
    std::map<std::string, std::vector<double>> symbol_pnls;
    std::map<std::optional<StrategyId>, std::vector<double>> strategy_pnls;

    for (const auto& pair : pairs) {
        const auto fields = core::calendar_fields(pair.exit_timestamp, session_utc_offset_minutes_);
        weekday_pnls[fields.weekday].push_back(pair.net_pnl);
        day_pnls[fields.day - 1].push_back(pair.net_pnl);
        hour_pnls[fields.hour].push_back(pair.net_pnl);
        symbol_pnls[underlying_symbol(pair.symbol)].push_back(pair.net_pnl);
        strategy_pnls[pair.strategy_id].push_back(pair.net_pnl);
    }

    EvaluationMetrics result;

    for (int weekday = 0; weekday < 7; ++weekday) {
        result.by_weekday.push_back(
            WeekdayBucket{weekday, weekday_name(weekday), summarize(weekday_pnls[weekday])});
    }
    for (int day = 1; day <= 31; ++day) {
        result.by_day_of_month.push_back(DayOfMonthBucket{day, summarize(day_pnls[day - 1])});
    }
    for (int hour = 0; hour < 24; ++hour) {
        result.by_hour.push_back(HourBucket{hour, hour_label(hour), summarize(hour_pnls[hour])});
    }

    for (const auto& [symbol, pnls] : symbol_pnls) {
        result.by_symbol.push_back(SymbolSegment{symbol, summarize(pnls)});
    }
    sort_by_total_pnl<SymbolSegment>(result.by_symbol, symbol_name);

    for (const auto& [id, pnls] : strategy_pnls) {
        std::string name = UNASSIGNED_STRATEGY;
        if (id) {
            auto it = strategy_names.find(*id);
            name = it != strategy_names.end() ? it->second : UNKNOWN_STRATEGY;
        }
        result.by_strategy.push_back(StrategySegment{id, name, summarize(pnls)});
    }
    sort_by_total_pnl<StrategySegment>(result.by_strategy, strategy_name);

    return result;
}

SegmentStats SegmentationAnalyzer::summarize(const std::vector<double>& net_pnls) {
    SegmentStats stats;
    for (double pnl : net_pnls) {
        stats.trade_count++;
        stats.total_pnl += pnl;
        if (pnl > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += pnl;
        } else if (pnl < 0.0) {
            stats.losing_trades++;
            stats.gross_loss += pnl;
        }
    }

    stats.win_rate = statistics::safe_divide(stats.winning_trades, stats.trade_count);
    stats.average_pnl = statistics::safe_divide(stats.total_pnl, stats.trade_count);
    stats.average_win = statistics::safe_divide(stats.gross_profit, stats.winning_trades);
    stats.average_loss = statistics::safe_divide(stats.gross_loss, stats.losing_trades);
    stats.payoff_ratio = MetricsCalculator::payoff_ratio(stats.average_win, stats.average_loss,
                                                         stats.winning_trades, stats.losing_trades);
    stats.profit_factor = MetricsCalculator::profit_factor(stats.gross_profit, stats.gross_loss);
    return stats;
}

std::string SegmentationAnalyzer::weekday_name(int weekday) {
    static const char* names[] = {"Monday", "Tuesday",  "Wednesday", "Thursday",
                                  "Friday", "Saturday", "Sunday"};
    if (weekday < 0 || weekday > 6) {
        return "";
    }
    return names[weekday];
}

std::string SegmentationAnalyzer::hour_label(int hour) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:00-%02d:59", hour, hour);
    return std::string(buffer);
}

}  // namespace trade_journal
