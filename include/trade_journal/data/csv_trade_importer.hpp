// include/trade_journal/data/csv_trade_importer.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "trade_journal/core/error.hpp"
#include "trade_journal/core/types.hpp"
#include "trade_journal/data/conversion_utils.hpp"
#include "trade_journal/data/trade_store.hpp"

namespace trade_journal {

/**
 * @brief Supported broker export layouts
 */
enum class CsvFormat {
    GENERIC,  // symbol, side, quantity, price, timestamp[, fees, order_type, status, notes, strategy_id]
    WEBULL    // Webull order history export
};

std::string csv_format_to_string(CsvFormat format);

/**
 * @brief Executions recovered from one CSV document
 */
struct CsvParseResult {
    CsvFormat format{CsvFormat::GENERIC};
    std::vector<Execution> executions;
    std::vector<std::string> errors;  // One entry per rejected row
    size_t skipped_rows{0};           // Cancelled, unfilled or unpriced orders
};

/**
 * @brief Parses broker CSV exports and stores the executions
 *
 * Rows that fail validation are reported and skipped; the rest of the file
 * is still imported. Duplicate fills are skipped by the store.
 */
class CsvTradeImporter {
public:
    explicit CsvTradeImporter(std::shared_ptr<TradeStore> store);

    /**
     * @brief Parse CSV text without touching the store
     * @param csv_text Raw CSV including the header line
     * @return Parsed rows, or CSV_PARSE_ERROR when the document itself is unusable
     */
    Result<CsvParseResult> parse(const std::string& csv_text) const;

    /**
     * @brief Parse and insert as one batch
     * @return Inserted ids, duplicate count and row errors
     */
    Result<ImportSummary> import_csv(const std::string& csv_text);

    /**
     * @brief Webull exports are recognised by their "Filled", "Placed Time" or "Filled Time" columns
     */
    static CsvFormat detect_format(const StringTable& table);

private:
    Result<CsvParseResult> parse_generic(const StringTable& table) const;
    Result<CsvParseResult> parse_webull(const StringTable& table) const;

    std::shared_ptr<TradeStore> store_;
};

}  // namespace trade_journal
