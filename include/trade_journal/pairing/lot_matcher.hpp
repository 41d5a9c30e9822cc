// include/trade_journal/pairing/lot_matcher.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "trade_journal/core/types.hpp"

namespace trade_journal {

/**
 * @brief Direction of a round trip, set by the side that opened it
 */
enum class TradeDirection { LONG, SHORT };

std::string direction_to_string(TradeDirection direction);

/**
 * @brief Open quantity of one execution while matching runs
 *
 * fees is the execution's total fee; fees_charged is the part already
 * allocated to pairs. The final match against a lot takes the remainder so
 * the allocations sum to the execution fee exactly.
 */
struct Lot {
    ExecutionId execution_id{0};
    std::string symbol;
    Side side{Side::BUY};
    Quantity original_quantity{0.0};
    Quantity remaining_quantity{0.0};
    Price price{0.0};
    Timestamp timestamp;
    double fees{0.0};
    double fees_charged{0.0};
    std::optional<StrategyId> strategy_id;
};

/**
 * @brief One closed round trip: part of an entry execution matched against part of an exit
 */
struct PairedTrade {
    std::string symbol;
    ExecutionId entry_execution_id{0};
    ExecutionId exit_execution_id{0};
    Quantity quantity{0.0};
    Price entry_price{0.0};
    Price exit_price{0.0};
    Timestamp entry_timestamp;
    Timestamp exit_timestamp;
    double entry_fees{0.0};
    double exit_fees{0.0};
    double gross_pnl{0.0};
    double net_pnl{0.0};
    TradeDirection direction{TradeDirection::LONG};
    double multiplier{1.0};
    std::optional<StrategyId> strategy_id;

    double total_fees() const {
        return entry_fees + exit_fees;
    }
};

/**
 * @brief Unmatched residual of an execution after matching
 */
struct OpenLot {
    ExecutionId execution_id{0};
    std::string symbol;
    Side side{Side::BUY};
    Quantity remaining_quantity{0.0};
    Price price{0.0};
    double cost_basis{0.0};
    Timestamp timestamp;
    double unallocated_fees{0.0};
    std::optional<StrategyId> strategy_id;
};

struct PairingResult {
    std::vector<PairedTrade> pairs;
    std::vector<OpenLot> open_lots;
};

struct LotMatcherOptions {
    double quantity_epsilon{1e-4};   // Quantities at or below this count as zero
    double option_multiplier{100.0};  // Applied to P&L of option contract symbols
};

/**
 * @brief Turns independent executions into round-trip pairs
 *
 * Executions are processed in (timestamp, id) order, per exact symbol. An
 * execution first closes lots on the opposite side, taking the oldest lot
 * under FIFO or the newest under LIFO, and any residual opens a new lot on
 * its own side. Matching never fails: unmatched quantity stays open.
 */
class LotMatcher {
public:
    explicit LotMatcher(PairingMethod method, LotMatcherOptions options = LotMatcherOptions());

    /**
     * @brief Match a full execution history
     * @param executions Executions in any order
     * @return Pairs in exit order, then open lots in entry order
     */
    PairingResult match(const std::vector<Execution>& executions) const;

    PairingMethod method() const {
        return method_;
    }

    /**
     * @brief Keep the pairs whose exit falls within the range
     *
     * Entries may lie before the range start.
     */
    static std::vector<PairedTrade> filter_by_exit(const std::vector<PairedTrade>& pairs,
                                                   const DateRange& range);

private:
    PairingMethod method_;
    LotMatcherOptions options_;
};

}  // namespace trade_journal
