// include/trade_journal/data/in_memory_trade_store.hpp
#pragma once

#include <mutex>
#include "trade_journal/data/trade_store.hpp"

namespace trade_journal {

/**
 * @brief Process-local trade store with copy-on-write snapshots
 *
 * Writers build a new snapshot and swap it in under the lock. Readers keep
 * whatever snapshot they obtained for as long as they hold the pointer.
 */
class InMemoryTradeStore : public TradeStore {
public:
    InMemoryTradeStore();

    Result<SnapshotPtr> snapshot() const override;
    Result<ImportSummary> insert_executions(const std::vector<Execution>& executions) override;
    Result<StrategyId> add_strategy(const Strategy& strategy) override;
    Result<size_t> clear_all() override;

private:
    mutable std::mutex mutex_;
    SnapshotPtr current_;
    ExecutionId next_execution_id_{1};
    StrategyId next_strategy_id_{1};
};

}  // namespace trade_journal
