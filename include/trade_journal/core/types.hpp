// include/trade_journal/core/types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "trade_journal/core/error.hpp"

namespace trade_journal {

/**
 * @brief Common type definitions used throughout the journal
 */
using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Quantity = double;
using ExecutionId = int64_t;
using StrategyId = int64_t;

/**
 * @brief Execution side
 */
enum class Side { BUY, SELL };

/**
 * @brief Ordering policy for matching closing executions against open lots
 */
enum class PairingMethod {
    FIFO,  // Oldest open lot is closed first
    LIFO   // Most recent open lot is closed first
};

std::string side_to_string(Side side);

/**
 * @brief Parse a broker side string ("BUY", "Sell", "b", ...)
 * @param text Side as written by the broker
 * @return Parsed side or INVALID_DATA
 */
Result<Side> parse_side(const std::string& text);

std::string pairing_method_to_string(PairingMethod method);

/**
 * @brief Parse a pairing method name, case-insensitive
 * @param text "FIFO" or "LIFO"
 * @return Parsed method or INVALID_PAIRING_METHOD
 */
Result<PairingMethod> parse_pairing_method(const std::string& text);

/**
 * @brief A single raw fill as recorded by the broker
 *
 * Executions are immutable once stored. They are removed only by clearing
 * the whole store.
 */
struct Execution {
    ExecutionId id{0};
    std::string symbol;
    Side side{Side::BUY};
    Quantity quantity{0.0};
    Price price{0.0};
    Timestamp timestamp;
    double fees{0.0};
    std::optional<StrategyId> strategy_id;
    std::string order_type;
    std::string status;
    std::string notes;
};

/**
 * @brief Whether an execution with this status takes part in matching
 *
 * Empty, "FILLED" and "PARTIALLY FILLED" (any case) count as fills.
 * Pending, rejected and cancelled orders do not.
 */
bool is_filled_status(const std::string& status);

/**
 * @brief Named grouping the trader assigns executions to
 */
struct Strategy {
    StrategyId id{0};
    std::string name;
    std::string description;
};

/**
 * @brief Inclusive time window, unbounded on a side when empty
 */
struct DateRange {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;

    bool contains(const Timestamp& ts) const {
        if (start && ts < *start)
            return false;
        if (end && ts > *end)
            return false;
        return true;
    }

    bool is_bounded() const {
        return start.has_value() || end.has_value();
    }
};

}  // namespace trade_journal
