// include/trade_journal/data/trade_store.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_journal/core/error.hpp"
#include "trade_journal/core/types.hpp"

namespace trade_journal {

/**
 * @brief Immutable view of every stored execution and strategy name
 *
 * All analytics for a single request read one snapshot, so a concurrent
 * import or clear is either fully visible or not visible at all.
 */
struct TradeSnapshot {
    uint64_t version{0};
    std::vector<Execution> executions;
    std::unordered_map<StrategyId, std::string> strategy_names;

    std::optional<std::string> strategy_name(StrategyId id) const {
        auto it = strategy_names.find(id);
        if (it == strategy_names.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

using SnapshotPtr = std::shared_ptr<const TradeSnapshot>;

/**
 * @brief Outcome of inserting a batch of executions
 */
struct ImportSummary {
    std::vector<ExecutionId> imported_ids;
    size_t skipped_duplicates{0};
    std::vector<std::string> errors;
};

/**
 * @brief Two executions are duplicates when symbol, side, quantity, price and time match
 */
inline bool is_same_fill(const Execution& a, const Execution& b) {
    return a.symbol == b.symbol && a.side == b.side && a.quantity == b.quantity &&
           a.price == b.price && a.timestamp == b.timestamp;
}

/**
 * @brief Storage of raw executions and strategy names
 */
class TradeStore {
public:
    virtual ~TradeStore() = default;

    /**
     * @brief Consistent view of the current contents
     */
    virtual Result<SnapshotPtr> snapshot() const = 0;

    /**
     * @brief Insert executions as one atomic batch
     *
     * Ids are assigned by the store. Executions that duplicate a stored
     * execution, or an earlier one in the same batch, are skipped.
     *
     * @param executions Executions to add; their id field is ignored
     * @return Ids of inserted executions and the duplicate count
     */
    virtual Result<ImportSummary> insert_executions(const std::vector<Execution>& executions) = 0;

    /**
     * @brief Create a strategy and return its id
     */
    virtual Result<StrategyId> add_strategy(const Strategy& strategy) = 0;

    /**
     * @brief Remove every execution, keeping strategies
     * @return Number of executions removed
     */
    virtual Result<size_t> clear_all() = 0;
};

}  // namespace trade_journal
