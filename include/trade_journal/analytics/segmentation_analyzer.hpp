// include/trade_journal/analytics/segmentation_analyzer.hpp
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_journal/core/types.hpp"
#include "trade_journal/pairing/lot_matcher.hpp"

namespace trade_journal {

/**
 * @brief Performance of one group of pairs
 */
struct SegmentStats {
    int trade_count = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double total_pnl = 0.0;
    double average_pnl = 0.0;
    double average_win = 0.0;
    double average_loss = 0.0;  // Negative or 0
    double payoff_ratio = 0.0;
    double profit_factor = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;  // Negative or 0
};

struct WeekdayBucket {
    int weekday = 0;  // 0 = Monday
    std::string label;
    SegmentStats stats;
};

struct DayOfMonthBucket {
    int day = 1;
    SegmentStats stats;
};

struct HourBucket {
    int hour = 0;
    std::string label;  // "HH:00-HH:59"
    SegmentStats stats;
};

struct SymbolSegment {
    std::string symbol;
    SegmentStats stats;
};

struct StrategySegment {
    std::optional<StrategyId> strategy_id;
    std::string strategy_name;
    SegmentStats stats;
};

/**
 * @brief Breakdown of closed pairs by calendar position, symbol and strategy
 *
 * Weekday, day-of-month and hour lists always hold every bucket (7, 31
 * and 24 entries) so charts get a complete axis.
 */
struct EvaluationMetrics {
    std::vector<WeekdayBucket> by_weekday;
    std::vector<DayOfMonthBucket> by_day_of_month;
    std::vector<HourBucket> by_hour;
    std::vector<SymbolSegment> by_symbol;
    std::vector<StrategySegment> by_strategy;
};

/**
 * @brief Groups pairs by exit time, underlying symbol and strategy
 */
class SegmentationAnalyzer {
public:
    static constexpr const char* UNASSIGNED_STRATEGY = "Unassigned";
    static constexpr const char* UNKNOWN_STRATEGY = "Unknown";

    explicit SegmentationAnalyzer(int session_utc_offset_minutes = 0);

    EvaluationMetrics analyze(const std::vector<PairedTrade>& pairs,
                              const std::unordered_map<StrategyId, std::string>& strategy_names) const;

    /**
     * @brief Statistics of one group given its net P&L values
     */
    static SegmentStats summarize(const std::vector<double>& net_pnls);

    static std::string weekday_name(int weekday);
    static std::string hour_label(int hour);

private:
    int session_utc_offset_minutes_;
};

}  // namespace trade_journal
