// include/trade_journal/pairing/position_grouper.hpp
#pragma once

#include <vector>
#include "trade_journal/core/types.hpp"
#include "trade_journal/pairing/lot_matcher.hpp"

namespace trade_journal {

/**
 * @brief Executions of one symbol from a flat position back to flat
 *
 * The group stays open through a flip from long to short (or back) and
 * only ends when the signed quantity returns to zero.
 */
struct PositionGroup {
    Execution entry;                    // Execution that opened the position
    std::vector<Execution> executions;  // Entry plus every add and reduce, in time order
    double total_pnl{0.0};              // Net P&L of the pairs touching these executions
    Quantity final_quantity{0.0};       // Signed: long positive, short negative, 0 when closed

    bool is_closed() const {
        return final_quantity == 0.0;
    }
};

/**
 * @brief An execution with the pairs it opened and the pairs it closed
 */
struct ExecutionPairing {
    Execution execution;
    std::vector<PairedTrade> entry_pairs;
    std::vector<PairedTrade> exit_pairs;
};

/**
 * @brief Groups matched executions into positions
 */
class PositionGrouper {
public:
    explicit PositionGrouper(double quantity_epsilon = 1e-4);

    /**
     * @brief Build position groups per exact symbol
     * @param executions Executions given to the matcher, in any order
     * @param pairs Pairs the matcher produced from those executions
     * @return Groups, newest entry first
     */
    std::vector<PositionGroup> group(const std::vector<Execution>& executions,
                                     const std::vector<PairedTrade>& pairs) const;

    /**
     * @brief Attach to each execution the pairs where it is the entry or the exit
     * @return One entry per execution, newest first
     */
    static std::vector<ExecutionPairing> attach_pairs(const std::vector<Execution>& executions,
                                                      const std::vector<PairedTrade>& pairs);

private:
    double quantity_epsilon_;
};

}  // namespace trade_journal
