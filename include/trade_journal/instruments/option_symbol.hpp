// include/trade_journal/instruments/option_symbol.hpp
#pragma once

#include <optional>
#include <string>
#include "trade_journal/core/types.hpp"

namespace trade_journal {

enum class OptionType { CALL, PUT };

/**
 * @brief Fields encoded in an OCC-style option contract symbol
 *
 * Recognized forms are ROOT + YYMMDD + C|P + STRIKE, where the root may be
 * padded with spaces and the strike is either the 8-digit OCC encoding
 * (strike x 1000) or a plain decimal, e.g. "SPY240119C00450000",
 * "AAPL  240621P00180000", "TSLA240315C250".
 */
struct OptionSymbol {
    std::string underlying;
    Timestamp expiry;
    OptionType type{OptionType::CALL};
    double strike{0.0};
};

/**
 * @brief Decode an option contract symbol
 * @return Parsed fields, or nullopt when the symbol is not an option contract
 */
std::optional<OptionSymbol> parse_option_symbol(const std::string& symbol);

bool is_option_symbol(const std::string& symbol);

/**
 * @brief Symbol used to group trades: the root for options, the symbol itself otherwise
 */
std::string underlying_symbol(const std::string& symbol);

/**
 * @brief P&L multiplier per unit of quantity
 * @param symbol Traded symbol
 * @param option_multiplier Shares per option contract
 */
double contract_multiplier(const std::string& symbol, double option_multiplier = 100.0);

}  // namespace trade_journal
