// src/instruments/option_symbol.cpp
#include "trade_journal/instruments/option_symbol.hpp"
#include <regex>
#include "trade_journal/core/time_utils.hpp"

namespace trade_journal {

std::optional<OptionSymbol> parse_option_symbol(const std::string& symbol) {
    static const std::regex occ_regex(
        R"(^([A-Z][A-Z.]{0,5})\s*(\d{2})(\d{2})(\d{2})([CP])(\d+(?:\.\d+)?)$)");

    std::smatch m;
    if (!std::regex_match(symbol, m, occ_regex)) {
        return std::nullopt;
    }

    const int year = 2000 + std::stoi(m[2].str());
    const int month = std::stoi(m[3].str());
    const int day = std::stoi(m[4].str());
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    OptionSymbol option;
    option.underlying = m[1].str();
    option.expiry = core::make_utc_timestamp(year, month, day);
    option.type = m[5].str() == "C" ? OptionType::CALL : OptionType::PUT;

    const std::string strike = m[6].str();
    option.strike = std::stod(strike);
    if (strike.size() == 8 && strike.find('.') == std::string::npos) {
        option.strike /= 1000.0;
    }
    return option;
}

bool is_option_symbol(const std::string& symbol) {
    return parse_option_symbol(symbol).has_value();
}

std::string underlying_symbol(const std::string& symbol) {
    auto option = parse_option_symbol(symbol);
    return option ? option->underlying : symbol;
}

double contract_multiplier(const std::string& symbol, double option_multiplier) {
    return is_option_symbol(symbol) ? option_multiplier : 1.0;
}

}  // namespace trade_journal
