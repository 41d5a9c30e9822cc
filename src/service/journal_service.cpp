// src/service/journal_service.cpp
#include "trade_journal/service/journal_service.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <sstream>
#include "trade_journal/analytics/statistics_utils.hpp"
#include "trade_journal/core/logger.hpp"
#include "trade_journal/core/time_utils.hpp"
#include "trade_journal/instruments/option_symbol.hpp"
#include "trade_journal/service/json_serialization.hpp"

namespace trade_journal {

namespace {

std::string describe(const AnalyticsRequest& request) {
    std::ostringstream oss;
    oss << "method=" << request.pairing_method.value_or("<default>")
        << " start=" << request.start_date.value_or("<open>")
        << " end=" << request.end_date.value_or("<open>");
    return oss.str();
}

// ========== JSON Parameters ==========

Result<std::optional<std::string>> optional_string(const nlohmann::json& params,
                                                   const std::string& key) {
    if (!params.contains(key) || params.at(key).is_null()) {
        return Result<std::optional<std::string>>(std::optional<std::string>());
    }
    if (!params.at(key).is_string()) {
        return make_error<std::optional<std::string>>(
            ErrorCode::INVALID_ARGUMENT, "Parameter '" + key + "' must be a string",
            "JournalService");
    }
    return Result<std::optional<std::string>>(
        std::optional<std::string>(params.at(key).get<std::string>()));
}

// Integer parameter within [low, high]; missing or null gives an empty optional
Result<std::optional<int64_t>> optional_integer(const nlohmann::json& params,
                                                const std::string& key, int64_t low,
                                                int64_t high) {
    if (!params.contains(key) || params.at(key).is_null()) {
        return Result<std::optional<int64_t>>(std::optional<int64_t>());
    }
    const nlohmann::json& value = params.at(key);
    if (!value.is_number_integer()) {
        return make_error<std::optional<int64_t>>(
            ErrorCode::INVALID_ARGUMENT, "Parameter '" + key + "' must be an integer",
            "JournalService");
    }

    bool in_range = false;
    int64_t number = 0;
    if (value.is_number_unsigned()) {
        const uint64_t unsigned_number = value.get<uint64_t>();
        in_range = high >= 0 && unsigned_number <= static_cast<uint64_t>(high);
        number = in_range ? static_cast<int64_t>(unsigned_number) : 0;
    } else {
        number = value.get<int64_t>();
        in_range = number >= low && number <= high;
    }
    if (!in_range) {
        return make_error<std::optional<int64_t>>(
            ErrorCode::INVALID_ARGUMENT,
            "Parameter '" + key + "' is out of range: " + value.dump(), "JournalService");
    }
    return Result<std::optional<int64_t>>(std::optional<int64_t>(number));
}

Result<AnalyticsRequest> analytics_request_from_json(const nlohmann::json& params) {
    AnalyticsRequest request;
    for (const auto& [key, target] :
         {std::make_pair("pairingMethod", &request.pairing_method),
          std::make_pair("startDate", &request.start_date),
          std::make_pair("endDate", &request.end_date)}) {
        auto value = optional_string(params, key);
        if (value.is_error()) {
            return forward_error<AnalyticsRequest>(value);
        }
        *target = value.value();
    }
    return Result<AnalyticsRequest>(std::move(request));
}

template <typename T>
nlohmann::json to_json_value(const T& value) {
    return nlohmann::json(value);
}

template <typename T>
Result<nlohmann::json> as_json(const Result<T>& result) {
    if (result.is_error()) {
        return forward_error<nlohmann::json>(result);
    }
    return Result<nlohmann::json>(to_json_value(result.value()));
}

}  // namespace

JournalService::JournalService(std::shared_ptr<TradeStore> store, EngineConfig config)
    : store_(std::move(store)), config_(std::move(config)), importer_(store_) {
    Logger::register_component("JournalService");
}

// ========== Request Preparation ==========

template <typename T>
Result<T> JournalService::report_failure(const JournalError* error,
                                         const std::string& operation) const {
    if (is_input_error(error->code())) {
        WARN(operation << " rejected: " << error->what());
    } else {
        ERROR(operation << " failed: " << error->to_string());
    }
    return make_error<T>(error->code(), error->what(),
                         error->component().empty() ? "JournalService" : error->component());
}

Result<JournalService::PreparedRequest> JournalService::prepare(
    const AnalyticsRequest& request, const std::string& operation) const {
    DEBUG(operation << " " << describe(request));

    PreparedRequest prepared;
    prepared.method = config_.default_pairing_method;

    if (request.pairing_method) {
        auto method = parse_pairing_method(*request.pairing_method);
        if (method.is_error()) {
            return report_failure<PreparedRequest>(method.error(), operation);
        }
        prepared.method = method.value();
    }

    if (request.start_date) {
        auto start = core::parse_range_bound(*request.start_date, false);
        if (start.is_error()) {
            return report_failure<PreparedRequest>(start.error(), operation);
        }
        prepared.range.start = start.value();
    }

    if (request.end_date) {
        auto end = core::parse_range_bound(*request.end_date, true);
        if (end.is_error()) {
            return report_failure<PreparedRequest>(end.error(), operation);
        }
        prepared.range.end = end.value();
    }

    if (prepared.range.start && prepared.range.end && *prepared.range.start > *prepared.range.end) {
        JournalError error(ErrorCode::INVALID_DATE_RANGE,
                           "Start date " + request.start_date.value_or("") +
                               " is after end date " + request.end_date.value_or(""),
                           "JournalService");
        return report_failure<PreparedRequest>(&error, operation);
    }

    return Result<PreparedRequest>(std::move(prepared));
}

Result<JournalService::PairingContext> JournalService::run_pairing(
    const AnalyticsRequest& request, const std::string& operation) const {
    auto prepared = prepare(request, operation);
    if (prepared.is_error()) {
        return forward_error<PairingContext>(prepared);
    }

    if (!store_) {
        JournalError error(ErrorCode::NOT_INITIALIZED, "No trade store configured",
                           "JournalService");
        return report_failure<PairingContext>(&error, operation);
    }

    auto snapshot = store_->snapshot();
    if (snapshot.is_error()) {
        return report_failure<PairingContext>(snapshot.error(), operation);
    }

    PairingContext context;
    context.snapshot = snapshot.value();
    context.range = prepared.value().range;

    std::vector<Execution>& fills = context.fills;
    fills.reserve(context.snapshot->executions.size());
    for (const auto& execution : context.snapshot->executions) {
        if (is_filled_status(execution.status)) {
            fills.push_back(execution);
        }
    }

    LotMatcherOptions options;
    options.quantity_epsilon = config_.quantity_epsilon;
    options.option_multiplier = config_.option_multiplier;
    LotMatcher matcher(prepared.value().method, options);

    context.pairing = matcher.match(fills);
    context.in_range = LotMatcher::filter_by_exit(context.pairing.pairs, context.range);

    DEBUG(operation << " snapshot v" << context.snapshot->version << ": " << fills.size()
                    << " fills, " << context.pairing.pairs.size() << " pairs, "
                    << context.in_range.size() << " in range");
    return Result<PairingContext>(std::move(context));
}

// ========== Analytics Operations ==========

Result<Metrics> JournalService::compute_metrics(const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "computeMetrics");
    if (context.is_error()) {
        return forward_error<Metrics>(context);
    }

    const PairingContext& ctx = context.value();
    const std::vector<PairedTrade>& strategy_pairs =
        config_.strategy_metrics_respect_date_filter ? ctx.in_range : ctx.pairing.pairs;

    MetricsCalculator calculator(config_.session_utc_offset_minutes);
    return Result<Metrics>(calculator.calculate(ctx.in_range, strategy_pairs));
}

Result<std::vector<SymbolPnl>> JournalService::compute_symbol_pnl(
    const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "computeSymbolPnl");
    if (context.is_error()) {
        return forward_error<std::vector<SymbolPnl>>(context);
    }

    std::map<std::string, SymbolPnl> by_symbol;
    for (const auto& pair : context.value().in_range) {
        const std::string symbol = underlying_symbol(pair.symbol);
        SymbolPnl& entry = by_symbol[symbol];
        entry.symbol = symbol;
        entry.closed_positions++;
        entry.total_gross_pnl += pair.gross_pnl;
        entry.total_net_pnl += pair.net_pnl;
        entry.total_fees += pair.total_fees();
        if (pair.net_pnl > 0.0) {
            entry.winning_trades++;
        } else if (pair.net_pnl < 0.0) {
            entry.losing_trades++;
        }
    }

    std::map<std::string, double> open_quantity;
    for (const auto& lot : context.value().pairing.open_lots) {
        const double signed_qty =
            lot.side == Side::BUY ? lot.remaining_quantity : -lot.remaining_quantity;
        open_quantity[underlying_symbol(lot.symbol)] += signed_qty;
    }
    for (const auto& [symbol, quantity] : open_quantity) {
        if (std::abs(quantity) <= config_.quantity_epsilon) {
            continue;
        }
        SymbolPnl& entry = by_symbol[symbol];
        entry.symbol = symbol;
        entry.open_position_qty = quantity;
    }

    std::vector<SymbolPnl> result;
    for (auto& [symbol, entry] : by_symbol) {
        entry.win_rate = statistics::safe_divide(entry.winning_trades,
                                                 entry.winning_trades + entry.losing_trades);
        result.push_back(entry);
    }
    std::stable_sort(result.begin(), result.end(), [](const SymbolPnl& a, const SymbolPnl& b) {
        return a.total_net_pnl > b.total_net_pnl;
    });
    return Result<std::vector<SymbolPnl>>(std::move(result));
}

Result<std::vector<StrategyPerformance>> JournalService::compute_strategy_performance(
    const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "computeStrategyPerformance");
    if (context.is_error()) {
        return forward_error<std::vector<StrategyPerformance>>(context);
    }

    const PairingContext& ctx = context.value();
    std::map<std::optional<StrategyId>, StrategyPerformance> by_strategy;
    for (const auto& pair : ctx.in_range) {
        StrategyPerformance& entry = by_strategy[pair.strategy_id];
        if (entry.trade_count == 0) {
            entry.strategy_id = pair.strategy_id;
            if (pair.strategy_id) {
                entry.strategy_name = ctx.snapshot->strategy_name(*pair.strategy_id)
                                          .value_or(SegmentationAnalyzer::UNKNOWN_STRATEGY);
            } else {
                entry.strategy_name = SegmentationAnalyzer::UNASSIGNED_STRATEGY;
            }
        }
        entry.trade_count++;
        entry.total_volume += pair.quantity * pair.entry_price;
        entry.estimated_pnl += pair.net_pnl;
    }

    std::vector<StrategyPerformance> result;
    for (const auto& [id, entry] : by_strategy) {
        result.push_back(entry);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const StrategyPerformance& a, const StrategyPerformance& b) {
                         return a.trade_count > b.trade_count;
                     });
    return Result<std::vector<StrategyPerformance>>(std::move(result));
}

Result<std::vector<RecentTrade>> JournalService::compute_recent_trades(
    const RecentTradesRequest& request) const {
    const int limit = request.limit.value_or(config_.recent_trades_default_limit);
    if (limit < 0) {
        JournalError error(ErrorCode::INVALID_ARGUMENT,
                           "Limit must be zero or positive, got " + std::to_string(limit),
                           "JournalService");
        return report_failure<std::vector<RecentTrade>>(&error, "computeRecentTrades");
    }

    auto context = run_pairing(request, "computeRecentTrades");
    if (context.is_error()) {
        return forward_error<std::vector<RecentTrade>>(context);
    }

    const PairingContext& ctx = context.value();
    std::vector<PairedTrade> ordered = ctx.in_range;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const PairedTrade& a, const PairedTrade& b) {
                         return a.exit_timestamp > b.exit_timestamp;
                     });
    if (ordered.size() > static_cast<size_t>(limit)) {
        ordered.resize(limit);
    }

    std::vector<RecentTrade> result;
    result.reserve(ordered.size());
    for (const auto& pair : ordered) {
        RecentTrade trade;
        trade.symbol = pair.symbol;
        trade.entry_timestamp = pair.entry_timestamp;
        trade.exit_timestamp = pair.exit_timestamp;
        trade.quantity = pair.quantity;
        trade.entry_price = pair.entry_price;
        trade.exit_price = pair.exit_price;
        trade.net_pnl = pair.net_pnl;
        if (pair.strategy_id) {
            trade.strategy_name = ctx.snapshot->strategy_name(*pair.strategy_id)
                                      .value_or(SegmentationAnalyzer::UNKNOWN_STRATEGY);
        }
        result.push_back(trade);
    }
    return Result<std::vector<RecentTrade>>(std::move(result));
}

Result<EvaluationMetrics> JournalService::compute_evaluation_metrics(
    const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "computeEvaluationMetrics");
    if (context.is_error()) {
        return forward_error<EvaluationMetrics>(context);
    }

    SegmentationAnalyzer analyzer(config_.session_utc_offset_minutes);
    return Result<EvaluationMetrics>(
        analyzer.analyze(context.value().in_range, context.value().snapshot->strategy_names));
}

Result<DistributionConcentration> JournalService::compute_distribution_concentration(
    const DistributionRequest& request) const {
    const std::string operation = "computeDistributionConcentration";
    const double percent =
        request.concentration_percent.value_or(config_.default_concentration_percent);

    DistributionAnalyzer analyzer(config_.histogram_bins);

    // Reject a bad percent before reading the store
    auto validated = analyzer.analyze({}, percent);
    if (validated.is_error()) {
        return report_failure<DistributionConcentration>(validated.error(), operation);
    }

    auto context = run_pairing(request, operation);
    if (context.is_error()) {
        return forward_error<DistributionConcentration>(context);
    }
    return analyzer.analyze(context.value().in_range, percent);
}

Result<TiltStats> JournalService::compute_tilt_metric(const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "computeTiltMetric");
    if (context.is_error()) {
        return forward_error<TiltStats>(context);
    }

    TiltOptions options;
    options.max_streak = config_.tilt_max_streak;
    options.min_sample = config_.tilt_min_sample;
    options.min_total_trades = config_.tilt_min_total_trades;
    options.win_drop_threshold = config_.tilt_win_drop_threshold;

    TiltAnalyzer analyzer(options);
    return Result<TiltStats>(analyzer.analyze(context.value().in_range));
}

Result<std::vector<PairedTrade>> JournalService::get_paired_trades_by_strategy(
    const StrategyTradesRequest& request) const {
    auto context = run_pairing(request, "getPairedTradesByStrategy");
    if (context.is_error()) {
        return forward_error<std::vector<PairedTrade>>(context);
    }

    std::vector<PairedTrade> result;
    for (const auto& pair : context.value().in_range) {
        if (pair.strategy_id == request.strategy_id) {
            result.push_back(pair);
        }
    }
    return Result<std::vector<PairedTrade>>(std::move(result));
}

Result<std::vector<DailyPnl>> JournalService::compute_daily_pnl(
    const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "computeDailyPnl");
    if (context.is_error()) {
        return forward_error<std::vector<DailyPnl>>(context);
    }

    MetricsCalculator calculator(config_.session_utc_offset_minutes);
    return Result<std::vector<DailyPnl>>(calculator.calculate_daily_pnl(context.value().in_range));
}

Result<EquityCurve> JournalService::compute_equity_curve(const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "computeEquityCurve");
    if (context.is_error()) {
        return forward_error<EquityCurve>(context);
    }

    EquityCurveBuilder builder(config_.session_utc_offset_minutes);
    return Result<EquityCurve>(builder.build(context.value().in_range));
}

Result<std::vector<OpenLot>> JournalService::get_open_positions(
    const AnalyticsRequest& request) const {
    AnalyticsRequest undated;
    undated.pairing_method = request.pairing_method;

    auto context = run_pairing(undated, "getOpenPositions");
    if (context.is_error()) {
        return forward_error<std::vector<OpenLot>>(context);
    }
    return Result<std::vector<OpenLot>>(context.value().pairing.open_lots);
}

// ========== Positions ==========

Result<std::vector<PositionGroup>> JournalService::compute_position_groups(
    const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "computePositionGroups");
    if (context.is_error()) {
        return forward_error<std::vector<PositionGroup>>(context);
    }

    const PairingContext& ctx = context.value();
    PositionGrouper grouper(config_.quantity_epsilon);
    std::vector<PositionGroup> groups = grouper.group(ctx.fills, ctx.pairing.pairs);
    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [&ctx](const PositionGroup& group) {
                                    return !ctx.range.contains(group.entry.timestamp);
                                }),
                 groups.end());
    return Result<std::vector<PositionGroup>>(std::move(groups));
}

Result<std::vector<ExecutionPairing>> JournalService::get_trades_with_pairing(
    const AnalyticsRequest& request) const {
    auto context = run_pairing(request, "getTradesWithPairing");
    if (context.is_error()) {
        return forward_error<std::vector<ExecutionPairing>>(context);
    }

    const PairingContext& ctx = context.value();
    std::vector<Execution> in_range;
    for (const auto& execution : ctx.snapshot->executions) {
        if (ctx.range.contains(execution.timestamp)) {
            in_range.push_back(execution);
        }
    }
    return Result<std::vector<ExecutionPairing>>(
        PositionGrouper::attach_pairs(in_range, ctx.in_range));
}

// ========== Store Operations ==========

Result<ImportSummary> JournalService::import_trades_csv(const std::string& csv_text) {
    DEBUG("importTradesCsv " << csv_text.size() << " bytes");
    auto summary = importer_.import_csv(csv_text);
    if (summary.is_error()) {
        return report_failure<ImportSummary>(summary.error(), "importTradesCsv");
    }
    return summary;
}

Result<size_t> JournalService::clear_all_trades() {
    if (!store_) {
        JournalError error(ErrorCode::NOT_INITIALIZED, "No trade store configured",
                           "JournalService");
        return report_failure<size_t>(&error, "clearAllTrades");
    }

    auto removed = store_->clear_all();
    if (removed.is_error()) {
        return report_failure<size_t>(removed.error(), "clearAllTrades");
    }
    INFO("Cleared " << removed.value() << " executions");
    return removed;
}

// ========== Named Dispatch ==========

const std::vector<std::string>& JournalService::operation_names() {
    static const std::vector<std::string> names = {
        "computeMetrics",        "computeSymbolPnl",
        "computeStrategyPerformance", "computeRecentTrades",
        "computeEvaluationMetrics",   "computeDistributionConcentration",
        "computeTiltMetric",     "getPairedTradesByStrategy",
        "importTradesCsv",       "clearAllTrades",
        "computeDailyPnl",       "computeEquityCurve",
        "getOpenPositions",      "computePositionGroups",
        "getTradesWithPairing"};
    return names;
}

Result<nlohmann::json> JournalService::execute(const std::string& operation,
                                               const nlohmann::json& params) {
    if (!params.is_null() && !params.is_object()) {
        return make_error<nlohmann::json>(ErrorCode::INVALID_ARGUMENT,
                                          "Parameters must be a JSON object", "JournalService");
    }
    const nlohmann::json args = params.is_null() ? nlohmann::json::object() : params;

    if (operation == "importTradesCsv") {
        if (!args.contains("csv") || !args.at("csv").is_string()) {
            return make_error<nlohmann::json>(ErrorCode::INVALID_ARGUMENT,
                                              "importTradesCsv requires a 'csv' string",
                                              "JournalService");
        }
        return as_json(import_trades_csv(args.at("csv").get<std::string>()));
    }
    if (operation == "clearAllTrades") {
        auto removed = clear_all_trades();
        if (removed.is_error()) {
            return forward_error<nlohmann::json>(removed);
        }
        return Result<nlohmann::json>(nlohmann::json{{"removed", removed.value()}});
    }

    auto base = analytics_request_from_json(args);
    if (base.is_error()) {
        return forward_error<nlohmann::json>(base);
    }
    const AnalyticsRequest& request = base.value();

    if (operation == "computeMetrics") {
        return as_json(compute_metrics(request));
    }
    if (operation == "computeSymbolPnl") {
        return as_json(compute_symbol_pnl(request));
    }
    if (operation == "computeStrategyPerformance") {
        return as_json(compute_strategy_performance(request));
    }
    if (operation == "computeRecentTrades") {
        RecentTradesRequest recent;
        static_cast<AnalyticsRequest&>(recent) = request;
        auto limit = optional_integer(args, "limit", std::numeric_limits<int>::min(),
                                      std::numeric_limits<int>::max());
        if (limit.is_error()) {
            return forward_error<nlohmann::json>(limit);
        }
        if (limit.value()) {
            recent.limit = static_cast<int>(*limit.value());
        }
        return as_json(compute_recent_trades(recent));
    }
    if (operation == "computeEvaluationMetrics") {
        return as_json(compute_evaluation_metrics(request));
    }
    if (operation == "computeDistributionConcentration") {
        DistributionRequest distribution;
        static_cast<AnalyticsRequest&>(distribution) = request;
        if (args.contains("concentrationPercent") && !args.at("concentrationPercent").is_null()) {
            if (!args.at("concentrationPercent").is_number()) {
                return make_error<nlohmann::json>(ErrorCode::INVALID_ARGUMENT,
                                                  "Parameter 'concentrationPercent' must be a number",
                                                  "JournalService");
            }
            distribution.concentration_percent = args.at("concentrationPercent").get<double>();
        }
        return as_json(compute_distribution_concentration(distribution));
    }
    if (operation == "computeTiltMetric") {
        return as_json(compute_tilt_metric(request));
    }
    if (operation == "getPairedTradesByStrategy") {
        StrategyTradesRequest by_strategy;
        static_cast<AnalyticsRequest&>(by_strategy) = request;
        auto strategy_id = optional_integer(args, "strategyId",
                                            std::numeric_limits<StrategyId>::min(),
                                            std::numeric_limits<StrategyId>::max());
        if (strategy_id.is_error()) {
            return forward_error<nlohmann::json>(strategy_id);
        }
        if (strategy_id.value()) {
            by_strategy.strategy_id = *strategy_id.value();
        }
        return as_json(get_paired_trades_by_strategy(by_strategy));
    }
    if (operation == "computeDailyPnl") {
        return as_json(compute_daily_pnl(request));
    }
    if (operation == "computeEquityCurve") {
        return as_json(compute_equity_curve(request));
    }
    if (operation == "getOpenPositions") {
        return as_json(get_open_positions(request));
    }
    if (operation == "computePositionGroups") {
        return as_json(compute_position_groups(request));
    }
    if (operation == "getTradesWithPairing") {
        return as_json(get_trades_with_pairing(request));
    }

    return make_error<nlohmann::json>(ErrorCode::INVALID_ARGUMENT,
                                      "Unknown operation: " + operation, "JournalService");
}

}  // namespace trade_journal
