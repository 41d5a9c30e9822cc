// src/pairing/position_grouper.cpp
#include "trade_journal/pairing/position_grouper.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>

namespace trade_journal {

namespace {

bool earlier(const Execution& a, const Execution& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return a.id < b.id;
}

}  // namespace

PositionGrouper::PositionGrouper(double quantity_epsilon) : quantity_epsilon_(quantity_epsilon) {}

std::vector<PositionGroup> PositionGrouper::group(const std::vector<Execution>& executions,
                                                  const std::vector<PairedTrade>& pairs) const {
    std::map<std::string, std::vector<Execution>> by_symbol;
    for (const auto& execution : executions) {
        by_symbol[execution.symbol].push_back(execution);
    }

    std::vector<PositionGroup> groups;
    for (auto& [symbol, history] : by_symbol) {
        std::stable_sort(history.begin(), history.end(), earlier);

        PositionGroup current;
        double position = 0.0;
        for (const auto& execution : history) {
            if (current.executions.empty()) {
                current.entry = execution;
            }
            current.executions.push_back(execution);
            position += execution.side == Side::BUY ? execution.quantity : -execution.quantity;

            if (std::abs(position) <= quantity_epsilon_) {
                current.final_quantity = 0.0;
                groups.push_back(std::move(current));
                current = PositionGroup();
                position = 0.0;
            }
        }
        if (!current.executions.empty()) {
            current.final_quantity = position;
            groups.push_back(std::move(current));
        }
    }

    for (auto& position_group : groups) {
        std::set<ExecutionId> members;
        for (const auto& execution : position_group.executions) {
            members.insert(execution.id);
        }
        for (const auto& pair : pairs) {
            if (members.count(pair.entry_execution_id) || members.count(pair.exit_execution_id)) {
                position_group.total_pnl += pair.net_pnl;
            }
        }
    }

    std::stable_sort(groups.begin(), groups.end(),
                     [](const PositionGroup& a, const PositionGroup& b) {
                         return earlier(b.entry, a.entry);
                     });
    return groups;
}

std::vector<ExecutionPairing> PositionGrouper::attach_pairs(
    const std::vector<Execution>& executions, const std::vector<PairedTrade>& pairs) {
    std::map<ExecutionId, std::vector<PairedTrade>> as_entry;
    std::map<ExecutionId, std::vector<PairedTrade>> as_exit;
    for (const auto& pair : pairs) {
        as_entry[pair.entry_execution_id].push_back(pair);
        as_exit[pair.exit_execution_id].push_back(pair);
    }

    std::vector<ExecutionPairing> result;
    result.reserve(executions.size());
    for (const auto& execution : executions) {
        ExecutionPairing tagged;
        tagged.execution = execution;
        auto entry = as_entry.find(execution.id);
        if (entry != as_entry.end()) {
            tagged.entry_pairs = entry->second;
        }
        auto exit = as_exit.find(execution.id);
        if (exit != as_exit.end()) {
            tagged.exit_pairs = exit->second;
        }
        result.push_back(std::move(tagged));
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const ExecutionPairing& a, const ExecutionPairing& b) {
                         return earlier(b.execution, a.execution);
                     });
    return result;
}

}  // namespace trade_journal
