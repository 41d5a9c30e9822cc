// src/data/in_memory_trade_store.cpp
#include "trade_journal/data/in_memory_trade_store.hpp"
#include <algorithm>

namespace trade_journal {

InMemoryTradeStore::InMemoryTradeStore() : current_(std::make_shared<TradeSnapshot>()) {}

Result<SnapshotPtr> InMemoryTradeStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<SnapshotPtr>(current_);
}

Result<ImportSummary> InMemoryTradeStore::insert_executions(
    const std::vector<Execution>& executions) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto next = std::make_shared<TradeSnapshot>(*current_);
    ImportSummary summary;

    for (const auto& execution : executions) {
        const bool duplicate =
            std::any_of(next->executions.begin(), next->executions.end(),
                        [&](const Execution& stored) { return is_same_fill(stored, execution); });
        if (duplicate) {
            ++summary.skipped_duplicates;
            continue;
        }

        Execution stored = execution;
        stored.id = next_execution_id_++;
        next->executions.push_back(stored);
        summary.imported_ids.push_back(stored.id);
    }

    if (!summary.imported_ids.empty()) {
        next->version = current_->version + 1;
        current_ = std::move(next);
    }
    return Result<ImportSummary>(summary);
}

Result<StrategyId> InMemoryTradeStore::add_strategy(const Strategy& strategy) {
    if (strategy.name.empty()) {
        return make_error<StrategyId>(ErrorCode::INVALID_ARGUMENT, "Strategy name cannot be empty",
                                      "InMemoryTradeStore");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<TradeSnapshot>(*current_);
    const StrategyId id = next_strategy_id_++;
    next->strategy_names[id] = strategy.name;
    next->version = current_->version + 1;
    current_ = std::move(next);
    return Result<StrategyId>(id);
}

Result<size_t> InMemoryTradeStore::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<TradeSnapshot>();
    next->strategy_names = current_->strategy_names;
    next->version = current_->version + 1;
    const size_t removed = current_->executions.size();
    current_ = std::move(next);
    return Result<size_t>(removed);
}

}  // namespace trade_journal
