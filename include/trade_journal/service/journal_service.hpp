// include/trade_journal/service/journal_service.hpp
#pragma once

// Arrow before the logger macros
#include "trade_journal/data/csv_trade_importer.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trade_journal/analytics/distribution_analyzer.hpp"
#include "trade_journal/analytics/equity_curve_builder.hpp"
#include "trade_journal/analytics/metrics_calculator.hpp"
#include "trade_journal/analytics/segmentation_analyzer.hpp"
#include "trade_journal/analytics/tilt_analyzer.hpp"
#include "trade_journal/config/engine_config.hpp"
#include "trade_journal/core/error.hpp"
#include "trade_journal/data/trade_store.hpp"
#include "trade_journal/pairing/lot_matcher.hpp"
#include "trade_journal/pairing/position_grouper.hpp"

namespace trade_journal {

// ========== Requests ==========

/**
 * @brief Parameters shared by every analytics operation
 *
 * Dates are ISO-8601; a missing bound is unbounded and a date-only end
 * bound covers the whole day. A missing pairing method uses the configured
 * default, while an unrecognized one is rejected.
 */
struct AnalyticsRequest {
    std::optional<std::string> pairing_method;
    std::optional<std::string> start_date;
    std::optional<std::string> end_date;
};

struct RecentTradesRequest : public AnalyticsRequest {
    std::optional<int> limit;  // Configured default when missing
};

struct DistributionRequest : public AnalyticsRequest {
    std::optional<double> concentration_percent;  // Configured default when missing
};

struct StrategyTradesRequest : public AnalyticsRequest {
    std::optional<StrategyId> strategy_id;  // Missing selects pairs without a strategy
};

// ========== Responses ==========

/**
 * @brief Closed and open results for one underlying symbol
 */
struct SymbolPnl {
    std::string symbol;
    int closed_positions = 0;
    double open_position_qty = 0.0;  // Long minus short open quantity
    double total_gross_pnl = 0.0;
    double total_net_pnl = 0.0;
    double total_fees = 0.0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;  // winners / (winners + losers)
};

struct StrategyPerformance {
    std::optional<StrategyId> strategy_id;
    std::string strategy_name;
    int trade_count = 0;
    double total_volume = 0.0;
    double estimated_pnl = 0.0;
};

struct RecentTrade {
    std::string symbol;
    Timestamp entry_timestamp;
    Timestamp exit_timestamp;
    Quantity quantity = 0.0;
    Price entry_price = 0.0;
    Price exit_price = 0.0;
    double net_pnl = 0.0;
    std::optional<std::string> strategy_name;
};

/**
 * @brief Request/response surface of the journal engine
 *
 * Every analytics call validates its request, reads one store snapshot,
 * matches the full execution history and keeps the pairs whose exit falls
 * in the requested range. The analyzers are pure, so calls may run
 * concurrently from several threads.
 */
class JournalService {
public:
    JournalService(std::shared_ptr<TradeStore> store, EngineConfig config);

    Result<Metrics> compute_metrics(const AnalyticsRequest& request) const;
    Result<std::vector<SymbolPnl>> compute_symbol_pnl(const AnalyticsRequest& request) const;

    /**
     * @brief Per-strategy totals, sorted by trade count
     */
    Result<std::vector<StrategyPerformance>> compute_strategy_performance(
        const AnalyticsRequest& request) const;

    /**
     * @brief Most recently closed pairs, newest first
     */
    Result<std::vector<RecentTrade>> compute_recent_trades(
        const RecentTradesRequest& request) const;

    Result<EvaluationMetrics> compute_evaluation_metrics(const AnalyticsRequest& request) const;
    Result<DistributionConcentration> compute_distribution_concentration(
        const DistributionRequest& request) const;
    Result<TiltStats> compute_tilt_metric(const AnalyticsRequest& request) const;
    Result<std::vector<PairedTrade>> get_paired_trades_by_strategy(
        const StrategyTradesRequest& request) const;
    Result<std::vector<DailyPnl>> compute_daily_pnl(const AnalyticsRequest& request) const;
    Result<EquityCurve> compute_equity_curve(const AnalyticsRequest& request) const;

    /**
     * @brief Lots still open after matching the whole history; dates are ignored
     */
    Result<std::vector<OpenLot>> get_open_positions(const AnalyticsRequest& request) const;

    /**
     * @brief Flat-to-flat position groups whose entry falls in the range, newest first
     *
     * Groups are built from the whole history, so a position entered in range
     * keeps executions and P&L that fall after the range end.
     */
    Result<std::vector<PositionGroup>> compute_position_groups(
        const AnalyticsRequest& request) const;

    /**
     * @brief Executions in the range, each with its in-range pairs, newest first
     *
     * Every stored execution is listed, including ones that are not filled.
     */
    Result<std::vector<ExecutionPairing>> get_trades_with_pairing(
        const AnalyticsRequest& request) const;

    Result<ImportSummary> import_trades_csv(const std::string& csv_text);

    /**
     * @brief Remove every execution
     * @return Number of executions removed
     */
    Result<size_t> clear_all_trades();

    /**
     * @brief Run an operation by name with JSON parameters
     *
     * Names follow the external contract ("computeMetrics",
     * "computeTiltMetric", ...). Parameters use camelCase keys:
     * pairingMethod, startDate, endDate, limit, concentrationPercent,
     * strategyId and csv.
     *
     * @return The JSON response, or the operation's error
     */
    Result<nlohmann::json> execute(const std::string& operation, const nlohmann::json& params);

    static const std::vector<std::string>& operation_names();

    const EngineConfig& config() const {
        return config_;
    }

private:
    struct PreparedRequest {
        PairingMethod method{PairingMethod::FIFO};
        DateRange range;
    };

    struct PairingContext {
        SnapshotPtr snapshot;
        DateRange range;
        std::vector<Execution> fills;
        PairingResult pairing;
        std::vector<PairedTrade> in_range;
    };

    Result<PreparedRequest> prepare(const AnalyticsRequest& request,
                                    const std::string& operation) const;
    Result<PairingContext> run_pairing(const AnalyticsRequest& request,
                                       const std::string& operation) const;

    template <typename T>
    Result<T> report_failure(const JournalError* error, const std::string& operation) const;

    std::shared_ptr<TradeStore> store_;
    EngineConfig config_;
    CsvTradeImporter importer_;
};

}  // namespace trade_journal
