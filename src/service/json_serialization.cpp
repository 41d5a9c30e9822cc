// src/service/json_serialization.cpp
#include "trade_journal/service/journal_service.hpp"
#include "trade_journal/service/json_serialization.hpp"
#include "trade_journal/core/time_utils.hpp"

namespace trade_journal {

// ========== Trades ==========

void to_json(nlohmann::json& j, const Execution& execution) {
    j = nlohmann::json{{"id", execution.id},
                       {"symbol", execution.symbol},
                       {"side", side_to_string(execution.side)},
                       {"quantity", execution.quantity},
                       {"price", execution.price},
                       {"timestamp", core::format_iso8601(execution.timestamp)},
                       {"fees", execution.fees},
                       {"strategy_id", optional_to_json(execution.strategy_id)},
                       {"order_type", execution.order_type},
                       {"status", execution.status},
                       {"notes", execution.notes}};
}

void to_json(nlohmann::json& j, const PairedTrade& pair) {
    j = nlohmann::json{{"symbol", pair.symbol},
                       {"entry_execution_id", pair.entry_execution_id},
                       {"exit_execution_id", pair.exit_execution_id},
                       {"direction", direction_to_string(pair.direction)},
                       {"quantity", pair.quantity},
                       {"entry_price", pair.entry_price},
                       {"exit_price", pair.exit_price},
                       {"entry_timestamp", core::format_iso8601(pair.entry_timestamp)},
                       {"exit_timestamp", core::format_iso8601(pair.exit_timestamp)},
                       {"entry_fees", pair.entry_fees},
                       {"exit_fees", pair.exit_fees},
                       {"gross_pnl", pair.gross_pnl},
                       {"net_pnl", pair.net_pnl},
                       {"multiplier", pair.multiplier},
                       {"strategy_id", optional_to_json(pair.strategy_id)}};
}

void to_json(nlohmann::json& j, const OpenLot& lot) {
    j = nlohmann::json{{"execution_id", lot.execution_id},
                       {"symbol", lot.symbol},
                       {"side", side_to_string(lot.side)},
                       {"remaining_quantity", lot.remaining_quantity},
                       {"price", lot.price},
                       {"cost_basis", lot.cost_basis},
                       {"timestamp", core::format_iso8601(lot.timestamp)},
                       {"unallocated_fees", lot.unallocated_fees},
                       {"strategy_id", optional_to_json(lot.strategy_id)}};
}

void to_json(nlohmann::json& j, const ImportSummary& summary) {
    j = nlohmann::json{{"imported_count", summary.imported_ids.size()},
                       {"imported_ids", summary.imported_ids},
                       {"skipped_duplicates", summary.skipped_duplicates},
                       {"errors", summary.errors}};
}

void to_json(nlohmann::json& j, const PositionGroup& group) {
    j = nlohmann::json{{"entry_execution", group.entry},
                       {"executions", group.executions},
                       {"total_pnl", group.total_pnl},
                       {"final_quantity", group.final_quantity},
                       {"is_closed", group.is_closed()}};
}

void to_json(nlohmann::json& j, const ExecutionPairing& tagged) {
    j = nlohmann::json{{"execution", tagged.execution},
                       {"entry_pairs", tagged.entry_pairs},
                       {"exit_pairs", tagged.exit_pairs}};
}

// ========== Metrics ==========

void to_json(nlohmann::json& j, const Metrics& m) {
    j = nlohmann::json{{"total_trades", m.total_trades},
                       {"winning_trades", m.winning_trades},
                       {"losing_trades", m.losing_trades},
                       {"breakeven_trades", m.breakeven_trades},
                       {"win_rate", m.win_rate},
                       {"average_profit", m.average_profit},
                       {"average_loss", m.average_loss},
                       {"largest_win", m.largest_win},
                       {"largest_loss", m.largest_loss},
                       {"total_volume", m.total_volume},
                       {"gross_profit", m.gross_profit},
                       {"gross_loss", m.gross_loss},
                       {"profit_factor", m.profit_factor},
                       {"expectancy", m.expectancy},
                       {"average_trade", m.average_trade},
                       {"total_fees", m.total_fees},
                       {"net_profit", m.net_profit},
                       {"max_drawdown", m.max_drawdown},
                       {"sharpe_ratio", m.sharpe_ratio},
                       {"risk_reward_ratio", m.risk_reward_ratio},
                       {"trades_per_day", m.trades_per_day},
                       {"trading_days", m.trading_days},
                       {"best_day", m.best_day},
                       {"best_day_date", m.best_day_date},
                       {"worst_day", m.worst_day},
                       {"worst_day_date", m.worst_day_date},
                       {"consecutive_wins", m.consecutive_wins},
                       {"consecutive_losses", m.consecutive_losses},
                       {"current_win_streak", m.current_win_streak},
                       {"current_loss_streak", m.current_loss_streak},
                       {"average_holding_time_seconds", m.average_holding_time_seconds},
                       {"average_gain_pct", m.average_gain_pct},
                       {"average_loss_pct", m.average_loss_pct},
                       {"largest_win_pct", m.largest_win_pct},
                       {"largest_loss_pct", m.largest_loss_pct},
                       {"strategy_win_rate", m.strategy_win_rate},
                       {"strategy_winning_trades", m.strategy_winning_trades},
                       {"strategy_losing_trades", m.strategy_losing_trades},
                       {"strategy_profit_loss", m.strategy_profit_loss},
                       {"strategy_consecutive_wins", m.strategy_consecutive_wins},
                       {"strategy_consecutive_losses", m.strategy_consecutive_losses}};
}

void to_json(nlohmann::json& j, const DailyPnl& day) {
    j = nlohmann::json{
        {"date", day.date}, {"net_pnl", day.net_pnl}, {"trade_count", day.trade_count}};
}

// ========== Segmentation ==========

void to_json(nlohmann::json& j, const SegmentStats& s) {
    j = nlohmann::json{{"trade_count", s.trade_count},
                       {"winning_trades", s.winning_trades},
                       {"losing_trades", s.losing_trades},
                       {"win_rate", s.win_rate},
                       {"total_pnl", s.total_pnl},
                       {"average_pnl", s.average_pnl},
                       {"average_win", s.average_win},
                       {"average_loss", s.average_loss},
                       {"payoff_ratio", s.payoff_ratio},
                       {"profit_factor", s.profit_factor},
                       {"gross_profit", s.gross_profit},
                       {"gross_loss", s.gross_loss}};
}

void to_json(nlohmann::json& j, const WeekdayBucket& bucket) {
    j = bucket.stats;
    j["weekday"] = bucket.weekday;
    j["label"] = bucket.label;
}

void to_json(nlohmann::json& j, const DayOfMonthBucket& bucket) {
    j = bucket.stats;
    j["day"] = bucket.day;
}

void to_json(nlohmann::json& j, const HourBucket& bucket) {
    j = bucket.stats;
    j["hour"] = bucket.hour;
    j["label"] = bucket.label;
}

void to_json(nlohmann::json& j, const SymbolSegment& segment) {
    j = segment.stats;
    j["symbol"] = segment.symbol;
}

void to_json(nlohmann::json& j, const StrategySegment& segment) {
    j = segment.stats;
    j["strategy_id"] = optional_to_json(segment.strategy_id);
    j["strategy_name"] = segment.strategy_name;
}

void to_json(nlohmann::json& j, const EvaluationMetrics& evaluation) {
    j = nlohmann::json{{"by_weekday", evaluation.by_weekday},
                       {"by_day_of_month", evaluation.by_day_of_month},
                       {"by_hour", evaluation.by_hour},
                       {"by_symbol", evaluation.by_symbol},
                       {"by_strategy", evaluation.by_strategy}};
}

// ========== Distribution ==========

void to_json(nlohmann::json& j, const HistogramBin& bin) {
    j = nlohmann::json{{"bin_start", bin.bin_start},
                       {"bin_end", bin.bin_end},
                       {"count", bin.count},
                       {"total_pnl", bin.total_pnl}};
}

void to_json(nlohmann::json& j, const ConcentrationStats& s) {
    j = nlohmann::json{{"total_trades", s.total_trades},
                       {"profitable_trades_count", s.profitable_trades_count},
                       {"losing_trades_count", s.losing_trades_count},
                       {"concentration_percent", s.concentration_percent},
                       {"top_k_profit", s.top_k_profit},
                       {"top_k_loss", s.top_k_loss},
                       {"profit_share_top", s.profit_share_top},
                       {"loss_share_top", s.loss_share_top},
                       {"mean_return", s.mean_return},
                       {"median_return", s.median_return},
                       {"stability_score", s.stability_score},
                       {"insights", s.insights}};
}

void to_json(nlohmann::json& j, const DistributionConcentration& distribution) {
    j = nlohmann::json{{"histogram", distribution.histogram},
                       {"concentration", distribution.concentration}};
}

// ========== Tilt ==========

void to_json(nlohmann::json& j, const StreakStats& streak) {
    j = nlohmann::json{{"k", streak.k},
                       {"sample_size", streak.sample_size},
                       {"win_rate_after_k_losses", streak.win_rate_after_k_losses},
                       {"avg_pnl_after_k_losses", streak.avg_pnl_after_k_losses},
                       {"sufficient_sample", streak.sufficient_sample}};
}

void to_json(nlohmann::json& j, const TiltStats& t) {
    j = nlohmann::json{{"total_trades", t.total_trades},
                       {"baseline_win_rate", t.baseline_win_rate},
                       {"baseline_loss_rate", t.baseline_loss_rate},
                       {"win_rate_after_loss", t.win_rate_after_loss},
                       {"win_rate_after_win", t.win_rate_after_win},
                       {"win_rate_after_2_losses", t.win_rate_after_2_losses},
                       {"avg_loss_normally", t.avg_loss_normally},
                       {"avg_loss_after_loss", t.avg_loss_after_loss},
                       {"prob_loss_after_loss", t.prob_loss_after_loss},
                       {"tilt_score", t.tilt_score},
                       {"tilt_category", t.tilt_category},
                       {"recommended_streak", optional_to_json(t.recommended_streak)},
                       {"streak_stats", t.streak_stats},
                       {"coaching_lines", t.coaching_lines}};
}

// ========== Equity Curve ==========

void to_json(nlohmann::json& j, const EquityPoint& point) {
    j = nlohmann::json{{"date", point.date},
                       {"daily_pnl", point.daily_pnl},
                       {"cumulative_pnl", point.cumulative_pnl},
                       {"peak_equity", point.peak_equity},
                       {"drawdown", point.drawdown},
                       {"drawdown_pct", point.drawdown_pct},
                       {"is_max_drawdown", point.is_max_drawdown},
                       {"is_best_surge", point.is_best_surge}};
}

void to_json(nlohmann::json& j, const DrawdownMetrics& d) {
    j = nlohmann::json{{"max_drawdown", d.max_drawdown},
                       {"max_drawdown_pct", d.max_drawdown_pct},
                       {"max_drawdown_start", optional_to_json(d.max_drawdown_start)},
                       {"max_drawdown_end", optional_to_json(d.max_drawdown_end)},
                       {"avg_drawdown", d.avg_drawdown},
                       {"longest_drawdown_days", d.longest_drawdown_days},
                       {"longest_drawdown_start", optional_to_json(d.longest_drawdown_start)},
                       {"longest_drawdown_end", optional_to_json(d.longest_drawdown_end)}};
}

void to_json(nlohmann::json& j, const EquityCurve& curve) {
    j = nlohmann::json{{"equity_points", curve.points},
                       {"drawdown_metrics", curve.drawdown},
                       {"best_surge_value", curve.best_surge.value},
                       {"best_surge_start", optional_to_json(curve.best_surge.start)},
                       {"best_surge_end", optional_to_json(curve.best_surge.end)}};
}

// ========== Service Responses ==========

void to_json(nlohmann::json& j, const SymbolPnl& s) {
    j = nlohmann::json{{"symbol", s.symbol},
                       {"closed_positions", s.closed_positions},
                       {"open_position_qty", s.open_position_qty},
                       {"total_gross_pnl", s.total_gross_pnl},
                       {"total_net_pnl", s.total_net_pnl},
                       {"total_fees", s.total_fees},
                       {"winning_trades", s.winning_trades},
                       {"losing_trades", s.losing_trades},
                       {"win_rate", s.win_rate}};
}

void to_json(nlohmann::json& j, const StrategyPerformance& s) {
    j = nlohmann::json{{"strategy_id", optional_to_json(s.strategy_id)},
                       {"strategy_name", s.strategy_name},
                       {"trade_count", s.trade_count},
                       {"total_volume", s.total_volume},
                       {"estimated_pnl", s.estimated_pnl}};
}

void to_json(nlohmann::json& j, const RecentTrade& trade) {
    j = nlohmann::json{{"symbol", trade.symbol},
                       {"entry_timestamp", core::format_iso8601(trade.entry_timestamp)},
                       {"exit_timestamp", core::format_iso8601(trade.exit_timestamp)},
                       {"quantity", trade.quantity},
                       {"entry_price", trade.entry_price},
                       {"exit_price", trade.exit_price},
                       {"net_pnl", trade.net_pnl},
                       {"strategy_name", optional_to_json(trade.strategy_name)}};
}

}  // namespace trade_journal
