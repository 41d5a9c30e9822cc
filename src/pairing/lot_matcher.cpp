// src/pairing/lot_matcher.cpp
#include "trade_journal/pairing/lot_matcher.hpp"
#include <algorithm>
#include <deque>
#include <iterator>
#include <map>
#include "trade_journal/instruments/option_symbol.hpp"

namespace trade_journal {

namespace {

struct SymbolBook {
    std::deque<Lot> long_open;   // Unmatched buys
    std::deque<Lot> short_open;  // Unmatched sells
};

Lot make_lot(const Execution& execution) {
    Lot lot;
    lot.execution_id = execution.id;
    lot.symbol = execution.symbol;
    lot.side = execution.side;
    lot.original_quantity = execution.quantity;
    lot.remaining_quantity = execution.quantity;
    lot.price = execution.price;
    lot.timestamp = execution.timestamp;
    lot.fees = execution.fees;
    lot.strategy_id = execution.strategy_id;
    return lot;
}

// Consume quantity from a lot and return the fee share it carries
double take(Lot& lot, Quantity quantity, double epsilon) {
    double fee = 0.0;
    if (lot.remaining_quantity - quantity <= epsilon) {
        fee = lot.fees - lot.fees_charged;
        lot.remaining_quantity = 0.0;
    } else {
        fee = lot.original_quantity > 0.0 ? lot.fees * quantity / lot.original_quantity : 0.0;
        lot.remaining_quantity -= quantity;
    }
    lot.fees_charged += fee;
    return fee;
}

OpenLot to_open_lot(const Lot& lot) {
    OpenLot open;
    open.execution_id = lot.execution_id;
    open.symbol = lot.symbol;
    open.side = lot.side;
    open.remaining_quantity = lot.remaining_quantity;
    open.price = lot.price;
    open.cost_basis = lot.remaining_quantity * lot.price;
    open.timestamp = lot.timestamp;
    open.unallocated_fees = lot.fees - lot.fees_charged;
    open.strategy_id = lot.strategy_id;
    return open;
}

}  // namespace

std::string direction_to_string(TradeDirection direction) {
    return direction == TradeDirection::LONG ? "LONG" : "SHORT";
}

LotMatcher::LotMatcher(PairingMethod method, LotMatcherOptions options)
    : method_(method), options_(options) {}

PairingResult LotMatcher::match(const std::vector<Execution>& executions) const {
    std::vector<Execution> ordered = executions;
    std::stable_sort(ordered.begin(), ordered.end(), [](const Execution& a, const Execution& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp < b.timestamp;
        }
        return a.id < b.id;
    });

    const double epsilon = options_.quantity_epsilon;
    std::map<std::string, SymbolBook> books;
    PairingResult result;

    for (const auto& execution : ordered) {
        if (execution.quantity <= epsilon) {
            continue;
        }

        SymbolBook& book = books[execution.symbol];
        std::deque<Lot>& opposing =
            execution.side == Side::BUY ? book.short_open : book.long_open;
        std::deque<Lot>& same_side =
            execution.side == Side::BUY ? book.long_open : book.short_open;

        const double multiplier =
            contract_multiplier(execution.symbol, options_.option_multiplier);
        Lot incoming = make_lot(execution);

        while (incoming.remaining_quantity > epsilon && !opposing.empty()) {
            Lot& entry = method_ == PairingMethod::FIFO ? opposing.front() : opposing.back();
            const Quantity matched = std::min(incoming.remaining_quantity, entry.remaining_quantity);

            PairedTrade pair;
            pair.symbol = execution.symbol;
            pair.entry_execution_id = entry.execution_id;
            pair.exit_execution_id = execution.id;
            pair.quantity = matched;
            pair.entry_price = entry.price;
            pair.exit_price = execution.price;
            pair.entry_timestamp = entry.timestamp;
            pair.exit_timestamp = execution.timestamp;
            pair.direction = entry.side == Side::BUY ? TradeDirection::LONG : TradeDirection::SHORT;
            pair.multiplier = multiplier;
            pair.strategy_id = entry.strategy_id ? entry.strategy_id : execution.strategy_id;
            pair.entry_fees = take(entry, matched, epsilon);
            pair.exit_fees = take(incoming, matched, epsilon);

            const double sign = pair.direction == TradeDirection::LONG ? 1.0 : -1.0;
            pair.gross_pnl = (pair.exit_price - pair.entry_price) * matched * sign * multiplier;
            pair.net_pnl = pair.gross_pnl - pair.entry_fees - pair.exit_fees;
            result.pairs.push_back(pair);

            if (entry.remaining_quantity <= epsilon) {
                if (method_ == PairingMethod::FIFO) {
                    opposing.pop_front();
                } else {
                    opposing.pop_back();
                }
            }
        }

        if (incoming.remaining_quantity > epsilon) {
            same_side.push_back(incoming);
        }
    }

    for (const auto& [symbol, book] : books) {
        for (const auto& lot : book.long_open) {
            result.open_lots.push_back(to_open_lot(lot));
        }
        for (const auto& lot : book.short_open) {
            result.open_lots.push_back(to_open_lot(lot));
        }
    }
    std::sort(result.open_lots.begin(), result.open_lots.end(),
              [](const OpenLot& a, const OpenLot& b) {
                  if (a.timestamp != b.timestamp) {
                      return a.timestamp < b.timestamp;
                  }
                  return a.execution_id < b.execution_id;
              });

    return result;
}

std::vector<PairedTrade> LotMatcher::filter_by_exit(const std::vector<PairedTrade>& pairs,
                                                    const DateRange& range) {
    if (!range.is_bounded()) {
        return pairs;
    }
    std::vector<PairedTrade> filtered;
    std::copy_if(pairs.begin(), pairs.end(), std::back_inserter(filtered),
                 [&range](const PairedTrade& pair) { return range.contains(pair.exit_timestamp); });
    return filtered;
}

}  // namespace trade_journal
