// tests/service/test_journal_service.cpp
#include "trade_journal/data/in_memory_trade_store.hpp"
#include "trade_journal/service/journal_service.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include "core/test_base.hpp"
#include "test_utils.hpp"

using namespace trade_journal;
using trade_journal::testing::at;
using trade_journal::testing::create_execution;

class JournalServiceTest : public trade_journal::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        store = std::make_shared<InMemoryTradeStore>();
        service = std::make_unique<JournalService>(store, config);
    }

    void rebuild_service() {
        service = std::make_unique<JournalService>(store, config);
    }

    void insert(const std::vector<Execution>& executions) {
        auto summary = store->insert_executions(executions);
        ASSERT_TRUE(summary.is_ok());
        ASSERT_EQ(summary.value().imported_ids.size(), executions.size());
    }

    // BUY 10@10, BUY 10@12, SELL 15@15
    void load_scale_in() {
        insert({create_execution(0, "AAPL", Side::BUY, 10, 10.0, at(2024, 3, 1, 14)),
                create_execution(0, "AAPL", Side::BUY, 10, 12.0, at(2024, 3, 1, 15)),
                create_execution(0, "AAPL", Side::SELL, 15, 15.0, at(2024, 3, 1, 16))});
    }

    /**
     * Closed pairs:
     *   AAPL +10  Breakout (1)  exit 2024-01-11
     *   MSFT -5   Scalp (2)     exit 2024-03-05
     *   TSLA +6   no strategy   exit 2024-03-07
     *   NVDA +2   unknown (99)  exit 2024-03-08
     * plus a cancelled AAPL buy that never matches.
     */
    void load_strategies() {
        ASSERT_TRUE(store->add_strategy(Strategy{0, "Breakout", ""}).is_ok());
        ASSERT_TRUE(store->add_strategy(Strategy{0, "Scalp", ""}).is_ok());

        Execution cancelled =
            create_execution(0, "AAPL", Side::BUY, 1, 100.0, at(2024, 3, 8, 17), 0.0, 1);
        cancelled.status = "Cancelled";

        insert({create_execution(0, "AAPL", Side::BUY, 1, 100.0, at(2024, 1, 10, 15), 0.0, 1),
                create_execution(0, "AAPL", Side::SELL, 1, 110.0, at(2024, 1, 11, 15), 0.0, 1),
                create_execution(0, "MSFT", Side::BUY, 1, 50.0, at(2024, 3, 4, 15), 0.0, 2),
                create_execution(0, "MSFT", Side::SELL, 1, 45.0, at(2024, 3, 5, 15), 0.0, 2),
                create_execution(0, "TSLA", Side::BUY, 2, 20.0, at(2024, 3, 6, 15)),
                create_execution(0, "TSLA", Side::SELL, 2, 23.0, at(2024, 3, 7, 15)),
                create_execution(0, "NVDA", Side::BUY, 1, 10.0, at(2024, 3, 8, 15), 0.0, 99),
                create_execution(0, "NVDA", Side::SELL, 1, 12.0, at(2024, 3, 8, 16), 0.0, 99),
                cancelled});
    }

    static AnalyticsRequest march() {
        AnalyticsRequest request;
        request.start_date = "2024-03-01";
        request.end_date = "2024-03-31";
        return request;
    }

    EngineConfig config;
    std::shared_ptr<InMemoryTradeStore> store;
    std::unique_ptr<JournalService> service;
};

// ========== Empty Store ==========

TEST_F(JournalServiceTest, EveryOperationHandlesEmptyStore) {
    AnalyticsRequest request;

    auto metrics = service->compute_metrics(request);
    ASSERT_TRUE(metrics.is_ok());
    EXPECT_EQ(metrics.value().total_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.value().profit_factor, 0.0);

    EXPECT_TRUE(service->compute_symbol_pnl(request).value().empty());
    EXPECT_TRUE(service->compute_strategy_performance(request).value().empty());
    EXPECT_TRUE(service->compute_recent_trades(RecentTradesRequest()).value().empty());
    EXPECT_TRUE(service->get_paired_trades_by_strategy(StrategyTradesRequest()).value().empty());
    EXPECT_TRUE(service->compute_daily_pnl(request).value().empty());
    EXPECT_TRUE(service->compute_equity_curve(request).value().points.empty());
    EXPECT_TRUE(service->get_open_positions(request).value().empty());

    auto evaluation = service->compute_evaluation_metrics(request);
    ASSERT_TRUE(evaluation.is_ok());
    EXPECT_EQ(evaluation.value().by_weekday.size(), 7u);
    EXPECT_EQ(evaluation.value().by_day_of_month.size(), 31u);
    EXPECT_EQ(evaluation.value().by_hour.size(), 24u);

    auto distribution = service->compute_distribution_concentration(DistributionRequest());
    ASSERT_TRUE(distribution.is_ok());
    EXPECT_EQ(distribution.value().concentration.insights,
              (std::vector<std::string>{"No trades in the selected timeframe."}));

    auto tilt = service->compute_tilt_metric(request);
    ASSERT_TRUE(tilt.is_ok());
    EXPECT_EQ(tilt.value().tilt_category, TiltAnalyzer::CATEGORY_INSUFFICIENT);
}

// ========== Pairing Method ==========

TEST_F(JournalServiceTest, PairingMethodChangesResults) {
    load_scale_in();

    AnalyticsRequest fifo;
    fifo.pairing_method = "FIFO";
    AnalyticsRequest lifo;
    lifo.pairing_method = "lifo";

    EXPECT_DOUBLE_EQ(service->compute_metrics(fifo).value().net_profit, 65.0);
    EXPECT_DOUBLE_EQ(service->compute_metrics(lifo).value().net_profit, 55.0);

    auto fifo_open = service->get_open_positions(fifo);
    ASSERT_TRUE(fifo_open.is_ok());
    ASSERT_EQ(fifo_open.value().size(), 1u);
    EXPECT_EQ(fifo_open.value()[0].execution_id, 2);
    EXPECT_DOUBLE_EQ(fifo_open.value()[0].remaining_quantity, 5.0);

    auto lifo_open = service->get_open_positions(lifo);
    ASSERT_TRUE(lifo_open.is_ok());
    ASSERT_EQ(lifo_open.value().size(), 1u);
    EXPECT_EQ(lifo_open.value()[0].execution_id, 1);
}

TEST_F(JournalServiceTest, MissingMethodUsesConfiguredDefault) {
    load_scale_in();
    config.default_pairing_method = PairingMethod::LIFO;
    rebuild_service();
    EXPECT_DOUBLE_EQ(service->compute_metrics(AnalyticsRequest()).value().net_profit, 55.0);
}

TEST_F(JournalServiceTest, SymbolPnlIncludesOpenQuantity) {
    load_scale_in();
    auto symbols = service->compute_symbol_pnl(AnalyticsRequest());
    ASSERT_TRUE(symbols.is_ok());
    ASSERT_EQ(symbols.value().size(), 1u);

    const SymbolPnl& aapl = symbols.value()[0];
    EXPECT_EQ(aapl.symbol, "AAPL");
    EXPECT_EQ(aapl.closed_positions, 2);
    EXPECT_DOUBLE_EQ(aapl.open_position_qty, 5.0);
    EXPECT_DOUBLE_EQ(aapl.total_net_pnl, 65.0);
    EXPECT_DOUBLE_EQ(aapl.win_rate, 1.0);
}

TEST_F(JournalServiceTest, OptionsUseContractMultiplier) {
    insert({create_execution(0, "SPY240119C00450000", Side::BUY, 1, 2.00, at(2024, 1, 10, 15)),
            create_execution(0, "SPY240119C00450000", Side::SELL, 1, 3.50, at(2024, 1, 11, 15))});

    EXPECT_DOUBLE_EQ(service->compute_metrics(AnalyticsRequest()).value().net_profit, 150.0);

    auto symbols = service->compute_symbol_pnl(AnalyticsRequest());
    ASSERT_EQ(symbols.value().size(), 1u);
    EXPECT_EQ(symbols.value()[0].symbol, "SPY");
}

// ========== Input Validation ==========

TEST_F(JournalServiceTest, RejectsInvalidRequests) {
    AnalyticsRequest bad_method;
    bad_method.pairing_method = "HIFO";
    auto method = service->compute_metrics(bad_method);
    ASSERT_TRUE(method.is_error());
    EXPECT_EQ(method.error()->code(), ErrorCode::INVALID_PAIRING_METHOD);

    AnalyticsRequest reversed;
    reversed.start_date = "2024-03-10";
    reversed.end_date = "2024-03-01";
    auto range = service->compute_tilt_metric(reversed);
    ASSERT_TRUE(range.is_error());
    EXPECT_EQ(range.error()->code(), ErrorCode::INVALID_DATE_RANGE);

    AnalyticsRequest bad_date;
    bad_date.start_date = "last tuesday";
    auto date = service->compute_evaluation_metrics(bad_date);
    ASSERT_TRUE(date.is_error());
    EXPECT_EQ(date.error()->code(), ErrorCode::INVALID_TIMESTAMP);

    RecentTradesRequest negative;
    negative.limit = -1;
    auto limit = service->compute_recent_trades(negative);
    ASSERT_TRUE(limit.is_error());
    EXPECT_EQ(limit.error()->code(), ErrorCode::INVALID_ARGUMENT);

    DistributionRequest wide;
    wide.concentration_percent = 50.0;
    auto percent = service->compute_distribution_concentration(wide);
    ASSERT_TRUE(percent.is_error());
    EXPECT_EQ(percent.error()->code(), ErrorCode::INVALID_CONCENTRATION);
}

TEST_F(JournalServiceTest, PercentIsCheckedBeforeTheStore) {
    JournalService detached(nullptr, config);

    DistributionRequest wide;
    wide.concentration_percent = 2.0;
    auto percent = detached.compute_distribution_concentration(wide);
    ASSERT_TRUE(percent.is_error());
    EXPECT_EQ(percent.error()->code(), ErrorCode::INVALID_CONCENTRATION);

    auto no_store = detached.compute_distribution_concentration(DistributionRequest());
    ASSERT_TRUE(no_store.is_error());
    EXPECT_EQ(no_store.error()->code(), ErrorCode::NOT_INITIALIZED);
}

// ========== Date Filtering ==========

TEST_F(JournalServiceTest, RangeSelectsPairsByExit) {
    load_strategies();

    auto in_march = service->compute_metrics(march());
    ASSERT_TRUE(in_march.is_ok());
    EXPECT_EQ(in_march.value().total_trades, 3);
    EXPECT_DOUBLE_EQ(in_march.value().net_profit, 3.0);

    // A date-only end bound covers that whole day
    AnalyticsRequest through_seventh;
    through_seventh.start_date = "2024-03-01";
    through_seventh.end_date = "2024-03-07";
    EXPECT_EQ(service->compute_metrics(through_seventh).value().total_trades, 2);

    // Entry before the range, exit inside it
    StrategyTradesRequest exit_day;
    exit_day.start_date = "2024-01-11";
    exit_day.end_date = "2024-01-11";
    exit_day.strategy_id = 1;
    auto pairs = service->get_paired_trades_by_strategy(exit_day);
    ASSERT_TRUE(pairs.is_ok());
    ASSERT_EQ(pairs.value().size(), 1u);
    EXPECT_EQ(pairs.value()[0].entry_timestamp, at(2024, 1, 10, 15));
}

TEST_F(JournalServiceTest, StrategyFieldsIgnoreDateFilterByDefault) {
    load_strategies();

    auto metrics = service->compute_metrics(march());
    ASSERT_TRUE(metrics.is_ok());
    EXPECT_EQ(metrics.value().strategy_winning_trades, 2);
    EXPECT_EQ(metrics.value().strategy_losing_trades, 1);
    EXPECT_DOUBLE_EQ(metrics.value().strategy_profit_loss, 7.0);

    // A range with no trades still reports all-time strategy figures
    AnalyticsRequest empty_range;
    empty_range.start_date = "2025-01-01";
    empty_range.end_date = "2025-01-31";
    auto empty = service->compute_metrics(empty_range);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value().total_trades, 0);
    EXPECT_DOUBLE_EQ(empty.value().net_profit, 0.0);
    EXPECT_DOUBLE_EQ(empty.value().strategy_profit_loss, 7.0);
}

TEST_F(JournalServiceTest, StrategyFieldsCanFollowDateFilter) {
    load_strategies();
    config.strategy_metrics_respect_date_filter = true;
    rebuild_service();

    auto metrics = service->compute_metrics(march());
    ASSERT_TRUE(metrics.is_ok());
    EXPECT_EQ(metrics.value().strategy_winning_trades, 1);
    EXPECT_EQ(metrics.value().strategy_losing_trades, 1);
    EXPECT_DOUBLE_EQ(metrics.value().strategy_profit_loss, -3.0);
}

// ========== Strategies ==========

TEST_F(JournalServiceTest, StrategyPerformanceNamesEveryGroup) {
    load_strategies();

    auto performance = service->compute_strategy_performance(AnalyticsRequest());
    ASSERT_TRUE(performance.is_ok());
    ASSERT_EQ(performance.value().size(), 4u);

    auto find = [&](const std::string& name) {
        return std::find_if(performance.value().begin(), performance.value().end(),
                            [&name](const StrategyPerformance& s) { return s.strategy_name == name; });
    };

    auto breakout = find("Breakout");
    ASSERT_NE(breakout, performance.value().end());
    EXPECT_EQ(breakout->trade_count, 1);
    EXPECT_DOUBLE_EQ(breakout->total_volume, 100.0);
    EXPECT_DOUBLE_EQ(breakout->estimated_pnl, 10.0);

    auto unassigned = find("Unassigned");
    ASSERT_NE(unassigned, performance.value().end());
    EXPECT_FALSE(unassigned->strategy_id.has_value());
    EXPECT_DOUBLE_EQ(unassigned->total_volume, 40.0);

    auto unknown = find("Unknown");
    ASSERT_NE(unknown, performance.value().end());
    EXPECT_EQ(unknown->strategy_id, std::optional<StrategyId>(99));
}

TEST_F(JournalServiceTest, PairedTradesByStrategy) {
    load_strategies();

    StrategyTradesRequest scalp;
    scalp.strategy_id = 2;
    auto scalp_pairs = service->get_paired_trades_by_strategy(scalp);
    ASSERT_TRUE(scalp_pairs.is_ok());
    ASSERT_EQ(scalp_pairs.value().size(), 1u);
    EXPECT_EQ(scalp_pairs.value()[0].symbol, "MSFT");

    auto unassigned = service->get_paired_trades_by_strategy(StrategyTradesRequest());
    ASSERT_TRUE(unassigned.is_ok());
    ASSERT_EQ(unassigned.value().size(), 1u);
    EXPECT_EQ(unassigned.value()[0].symbol, "TSLA");
}

TEST_F(JournalServiceTest, RecentTradesNewestFirst) {
    load_strategies();

    RecentTradesRequest request;
    request.limit = 2;
    auto recent = service->compute_recent_trades(request);
    ASSERT_TRUE(recent.is_ok());
    ASSERT_EQ(recent.value().size(), 2u);
    EXPECT_EQ(recent.value()[0].symbol, "NVDA");
    EXPECT_EQ(recent.value()[0].strategy_name, std::optional<std::string>("Unknown"));
    EXPECT_EQ(recent.value()[1].symbol, "TSLA");
    EXPECT_FALSE(recent.value()[1].strategy_name.has_value());

    request.limit = 0;
    EXPECT_TRUE(service->compute_recent_trades(request).value().empty());

    // Configured default of five covers all four pairs
    EXPECT_EQ(service->compute_recent_trades(RecentTradesRequest()).value().size(), 4u);
}

TEST_F(JournalServiceTest, CancelledExecutionsAreNotMatched) {
    load_strategies();
    auto open = service->get_open_positions(march());
    ASSERT_TRUE(open.is_ok());
    EXPECT_TRUE(open.value().empty());
}

TEST_F(JournalServiceTest, SymbolPnlSortedByNet) {
    load_strategies();
    auto symbols = service->compute_symbol_pnl(AnalyticsRequest());
    ASSERT_TRUE(symbols.is_ok());
    ASSERT_EQ(symbols.value().size(), 4u);
    EXPECT_EQ(symbols.value()[0].symbol, "AAPL");
    EXPECT_EQ(symbols.value()[1].symbol, "TSLA");
    EXPECT_EQ(symbols.value()[2].symbol, "NVDA");
    EXPECT_EQ(symbols.value()[3].symbol, "MSFT");
    EXPECT_DOUBLE_EQ(symbols.value()[3].win_rate, 0.0);
}

// ========== Positions ==========

TEST_F(JournalServiceTest, PositionGroupsSelectedByEntry) {
    load_strategies();
    insert({create_execution(0, "AMD", Side::BUY, 4, 100.0, at(2024, 2, 28, 15)),
            create_execution(0, "AMD", Side::SELL, 4, 101.0, at(2024, 3, 2, 15)),
            create_execution(0, "AMD", Side::SELL, 2, 105.0, at(2024, 3, 9, 15))});

    auto all = service->compute_position_groups(AnalyticsRequest());
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 6u);
    EXPECT_EQ(all.value()[0].entry.symbol, "AMD");
    EXPECT_DOUBLE_EQ(all.value()[0].final_quantity, -2.0);

    auto in_march = service->compute_position_groups(march());
    ASSERT_TRUE(in_march.is_ok());
    // MSFT, TSLA, NVDA and the open AMD short; the AMD long entered in February
    ASSERT_EQ(in_march.value().size(), 4u);
    for (const auto& group : in_march.value()) {
        EXPECT_NE(group.entry.timestamp, at(2024, 2, 28, 15));
    }
    EXPECT_EQ(in_march.value()[0].executions.size(), 1u);
}

TEST_F(JournalServiceTest, TradesWithPairingListsEveryExecutionInRange) {
    load_strategies();

    auto tagged = service->get_trades_with_pairing(march());
    ASSERT_TRUE(tagged.is_ok());
    // Six matched fills plus the cancelled buy
    ASSERT_EQ(tagged.value().size(), 7u);
    EXPECT_EQ(tagged.value()[0].execution.status, "Cancelled");
    EXPECT_TRUE(tagged.value()[0].entry_pairs.empty());

    const ExecutionPairing& nvda_exit = tagged.value()[1];
    EXPECT_EQ(nvda_exit.execution.symbol, "NVDA");
    ASSERT_EQ(nvda_exit.exit_pairs.size(), 1u);
    EXPECT_DOUBLE_EQ(nvda_exit.exit_pairs[0].net_pnl, 2.0);

    auto json = service->execute("getTradesWithPairing", {{"startDate", "2024-03-08"}});
    ASSERT_TRUE(json.is_ok());
    ASSERT_EQ(json.value().size(), 3u);
    EXPECT_EQ(json.value()[1]["execution"]["symbol"], "NVDA");
    EXPECT_EQ(json.value()[1]["exit_pairs"].size(), 1u);
}

// ========== Store Operations ==========

TEST_F(JournalServiceTest, ImportThenClear) {
    auto imported = service->import_trades_csv(
        "symbol,side,quantity,price,timestamp\n"
        "AAPL,BUY,1,10,2024-03-01T14:00:00Z\n"
        "AAPL,SELL,1,12,2024-03-01T15:00:00Z\n");
    ASSERT_TRUE(imported.is_ok());
    EXPECT_EQ(imported.value().imported_ids.size(), 2u);
    EXPECT_DOUBLE_EQ(service->compute_metrics(AnalyticsRequest()).value().net_profit, 2.0);

    auto removed = service->clear_all_trades();
    ASSERT_TRUE(removed.is_ok());
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(service->compute_metrics(AnalyticsRequest()).value().total_trades, 0);

    auto rejected = service->import_trades_csv("not,a,journal\n1,2,3\n");
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::CSV_PARSE_ERROR);
}

// ========== Named Dispatch ==========

TEST_F(JournalServiceTest, ExecuteDispatchesEveryOperation) {
    const nlohmann::json params = {
        {"csv", "symbol,side,quantity,price,timestamp\nAAPL,BUY,1,10,2024-03-01\n"}};
    for (const auto& name : JournalService::operation_names()) {
        auto result = service->execute(name, params);
        EXPECT_TRUE(result.is_ok()) << name << ": " << result.error()->what();
    }
    EXPECT_EQ(JournalService::operation_names().size(), 15u);
}

TEST_F(JournalServiceTest, ExecuteReturnsJson) {
    load_strategies();

    auto metrics = service->execute("computeMetrics", {{"startDate", "2024-03-01"}});
    ASSERT_TRUE(metrics.is_ok());
    EXPECT_EQ(metrics.value()["total_trades"], 3);

    auto recent = service->execute("computeRecentTrades", {{"limit", 1}});
    ASSERT_TRUE(recent.is_ok());
    ASSERT_TRUE(recent.value().is_array());
    EXPECT_EQ(recent.value().size(), 1u);
    EXPECT_EQ(recent.value()[0]["symbol"], "NVDA");

    auto by_strategy = service->execute("getPairedTradesByStrategy", {{"strategyId", 2}});
    ASSERT_TRUE(by_strategy.is_ok());
    ASSERT_EQ(by_strategy.value().size(), 1u);
    EXPECT_EQ(by_strategy.value()[0]["symbol"], "MSFT");

    auto distribution =
        service->execute("computeDistributionConcentration", {{"concentrationPercent", 20}});
    ASSERT_TRUE(distribution.is_ok());
    EXPECT_EQ(distribution.value()["concentration"]["concentration_percent"], 20.0);

    auto cleared = service->execute("clearAllTrades", nullptr);
    ASSERT_TRUE(cleared.is_ok());
    EXPECT_EQ(cleared.value()["removed"], 9);
}

TEST_F(JournalServiceTest, ExecuteRejectsBadParameters) {
    auto unknown = service->execute("computeEverything", nullptr);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_NE(std::string(unknown.error()->what()).find("Unknown operation"), std::string::npos);

    EXPECT_TRUE(service->execute("computeMetrics", nlohmann::json::array()).is_error());
    EXPECT_TRUE(service->execute("computeMetrics", {{"startDate", 5}}).is_error());
    EXPECT_TRUE(service->execute("computeRecentTrades", {{"limit", "1"}}).is_error());
    EXPECT_TRUE(service->execute("getPairedTradesByStrategy", {{"strategyId", 1.5}}).is_error());

    // Integers outside the parameter's type are rejected, not wrapped
    auto huge_limit = service->execute("computeRecentTrades", {{"limit", 4294967296LL}});
    ASSERT_TRUE(huge_limit.is_error());
    EXPECT_EQ(huge_limit.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(
        service->execute("computeRecentTrades", {{"limit", -4294967296LL}}).is_error());
    EXPECT_TRUE(service
                    ->execute("getPairedTradesByStrategy",
                              {{"strategyId", std::numeric_limits<uint64_t>::max()}})
                    .is_error());
    EXPECT_TRUE(service->execute("getPairedTradesByStrategy", {{"strategyId", 1e30}}).is_error());
    EXPECT_TRUE(service->execute("computeRecentTrades", {{"limit", 3}}).is_ok());
    EXPECT_TRUE(
        service->execute("computeDistributionConcentration", {{"concentrationPercent", "10"}})
            .is_error());
    EXPECT_TRUE(service->execute("importTradesCsv", nlohmann::json::object()).is_error());

    auto method = service->execute("computeTiltMetric", {{"pairingMethod", "HIFO"}});
    ASSERT_TRUE(method.is_error());
    EXPECT_EQ(method.error()->code(), ErrorCode::INVALID_PAIRING_METHOD);
}
