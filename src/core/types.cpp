// src/core/types.cpp
#include "trade_journal/core/types.hpp"
#include <algorithm>
#include <cctype>

namespace trade_journal {

namespace {
std::string to_upper_trimmed(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
    std::string out = begin < end ? std::string(begin, end) : std::string();
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}
}  // namespace

std::string side_to_string(Side side) {
    return side == Side::BUY ? "BUY" : "SELL";
}

Result<Side> parse_side(const std::string& text) {
    const std::string upper = to_upper_trimmed(text);
    if (upper == "BUY" || upper == "B" || upper == "BOT") {
        return Result<Side>(Side::BUY);
    }
    if (upper == "SELL" || upper == "S" || upper == "SLD" || upper == "SHORT") {
        return Result<Side>(Side::SELL);
    }
    return make_error<Side>(ErrorCode::INVALID_DATA, "Unrecognized side: '" + text + "'",
                            "Types");
}

std::string pairing_method_to_string(PairingMethod method) {
    switch (method) {
        case PairingMethod::FIFO:
            return "FIFO";
        case PairingMethod::LIFO:
            return "LIFO";
        default:
            return "UNKNOWN";
    }
}

Result<PairingMethod> parse_pairing_method(const std::string& text) {
    const std::string upper = to_upper_trimmed(text);
    if (upper == "FIFO") {
        return Result<PairingMethod>(PairingMethod::FIFO);
    }
    if (upper == "LIFO") {
        return Result<PairingMethod>(PairingMethod::LIFO);
    }
    return make_error<PairingMethod>(ErrorCode::INVALID_PAIRING_METHOD,
                                     "Unknown pairing method '" + text +
                                         "', expected FIFO or LIFO",
                                     "Types");
}

bool is_filled_status(const std::string& status) {
    const std::string upper = to_upper_trimmed(status);
    return upper.empty() || upper == "FILLED" || upper == "PARTIALLY FILLED";
}

}  // namespace trade_journal
