// include/trade_journal/service/json_serialization.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include "trade_journal/analytics/distribution_analyzer.hpp"
#include "trade_journal/analytics/equity_curve_builder.hpp"
#include "trade_journal/analytics/metrics_calculator.hpp"
#include "trade_journal/analytics/segmentation_analyzer.hpp"
#include "trade_journal/analytics/tilt_analyzer.hpp"
#include "trade_journal/data/trade_store.hpp"
#include "trade_journal/pairing/lot_matcher.hpp"
#include "trade_journal/pairing/position_grouper.hpp"

namespace trade_journal {

struct SymbolPnl;
struct StrategyPerformance;
struct RecentTrade;

/**
 * @brief JSON value of an optional, null when empty
 */
template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Response serializers, found by nlohmann::json through argument-dependent lookup.
// Timestamps are written as ISO-8601 UTC strings.

void to_json(nlohmann::json& j, const Execution& execution);
void to_json(nlohmann::json& j, const PairedTrade& pair);
void to_json(nlohmann::json& j, const OpenLot& lot);
void to_json(nlohmann::json& j, const ImportSummary& summary);
void to_json(nlohmann::json& j, const PositionGroup& group);
void to_json(nlohmann::json& j, const ExecutionPairing& tagged);

void to_json(nlohmann::json& j, const Metrics& metrics);
void to_json(nlohmann::json& j, const DailyPnl& day);

void to_json(nlohmann::json& j, const SegmentStats& stats);
void to_json(nlohmann::json& j, const WeekdayBucket& bucket);
void to_json(nlohmann::json& j, const DayOfMonthBucket& bucket);
void to_json(nlohmann::json& j, const HourBucket& bucket);
void to_json(nlohmann::json& j, const SymbolSegment& segment);
void to_json(nlohmann::json& j, const StrategySegment& segment);
void to_json(nlohmann::json& j, const EvaluationMetrics& evaluation);

void to_json(nlohmann::json& j, const HistogramBin& bin);
void to_json(nlohmann::json& j, const ConcentrationStats& stats);
void to_json(nlohmann::json& j, const DistributionConcentration& distribution);

void to_json(nlohmann::json& j, const StreakStats& streak);
void to_json(nlohmann::json& j, const TiltStats& tilt);

void to_json(nlohmann::json& j, const EquityPoint& point);
void to_json(nlohmann::json& j, const DrawdownMetrics& drawdown);
void to_json(nlohmann::json& j, const EquityCurve& curve);

void to_json(nlohmann::json& j, const SymbolPnl& symbol);
void to_json(nlohmann::json& j, const StrategyPerformance& strategy);
void to_json(nlohmann::json& j, const RecentTrade& trade);

}  // namespace trade_journal
