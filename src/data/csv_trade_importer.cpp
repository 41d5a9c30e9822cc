// src/data/csv_trade_importer.cpp
#include "trade_journal/data/csv_trade_importer.hpp"
#include <cmath>
#include "trade_journal/core/logger.hpp"
#include "trade_journal/core/time_utils.hpp"

namespace trade_journal {

namespace {

const std::vector<std::string> GENERIC_REQUIRED = {"symbol", "side", "quantity", "price",
                                                   "timestamp"};
const std::vector<std::string> WEBULL_REQUIRED = {"Symbol", "Side", "Filled"};
const std::vector<std::string> WEBULL_FEE_COLUMNS = {"Commission", "Fees", "Fee", "Total Fees"};

// Largest id a double carries exactly (2^53)
constexpr double MAX_EXACT_STRATEGY_ID = 9007199254740992.0;

// Header is line 1
std::string row_label(int64_t row) {
    return "Row " + std::to_string(row + 2);
}

std::string cell(const StringTable& table, const std::string& column, int64_t row) {
    return table.get(column, row).value_or("");
}

Result<void> require_columns(const StringTable& table, const std::vector<std::string>& columns) {
    for (const auto& column : columns) {
        if (!table.has_column(column)) {
            return make_error<void>(ErrorCode::CSV_PARSE_ERROR,
                                    "Missing required column: " + column, "CsvTradeImporter");
        }
    }
    return Result<void>();
}

}  // namespace

std::string csv_format_to_string(CsvFormat format) {
    return format == CsvFormat::WEBULL ? "WEBULL" : "GENERIC";
}

CsvTradeImporter::CsvTradeImporter(std::shared_ptr<TradeStore> store) : store_(std::move(store)) {
    Logger::register_component("CsvTradeImporter");
}

CsvFormat CsvTradeImporter::detect_format(const StringTable& table) {
    for (const auto& name : table.column_names()) {
        if (name == "Filled" || name == "Placed Time" || name == "Filled Time") {
            return CsvFormat::WEBULL;
        }
    }
    return CsvFormat::GENERIC;
}

Result<CsvParseResult> CsvTradeImporter::parse(const std::string& csv_text) const {
    auto table_result = DataConversionUtils::read_csv_as_strings(csv_text);
    if (table_result.is_error()) {
        return forward_error<CsvParseResult>(table_result, "CsvTradeImporter");
    }

    const StringTable& table = table_result.value();
    return detect_format(table) == CsvFormat::WEBULL ? parse_webull(table) : parse_generic(table);
}

Result<ImportSummary> CsvTradeImporter::import_csv(const std::string& csv_text) {
    if (!store_) {
        return make_error<ImportSummary>(ErrorCode::NOT_INITIALIZED, "No trade store configured",
                                         "CsvTradeImporter");
    }

    auto parsed = parse(csv_text);
    if (parsed.is_error()) {
        WARN("CSV import rejected: " << parsed.error()->what());
        return forward_error<ImportSummary>(parsed);
    }

    const CsvParseResult& rows = parsed.value();
    auto inserted = store_->insert_executions(rows.executions);
    if (inserted.is_error()) {
        ERROR("Failed to store imported executions: " << inserted.error()->what());
        return forward_error<ImportSummary>(inserted);
    }

    ImportSummary summary = inserted.value();
    summary.errors.insert(summary.errors.end(), rows.errors.begin(), rows.errors.end());

    INFO("Imported " << summary.imported_ids.size() << " executions ("
                     << csv_format_to_string(rows.format) << "), " << summary.skipped_duplicates
                     << " duplicates, " << rows.skipped_rows << " skipped rows, "
                     << rows.errors.size() << " invalid rows");
    return Result<ImportSummary>(std::move(summary));
}

// ========== Generic Format ==========

Result<CsvParseResult> CsvTradeImporter::parse_generic(const StringTable& table) const {
    auto columns = require_columns(table, GENERIC_REQUIRED);
    if (columns.is_error()) {
        return forward_error<CsvParseResult>(columns);
    }

    CsvParseResult result;
    result.format = CsvFormat::GENERIC;

    for (int64_t row = 0; row < table.num_rows(); ++row) {
        const std::string label = row_label(row);

        Execution execution;
        execution.symbol = cell(table, "symbol", row);
        if (execution.symbol.empty()) {
            result.errors.push_back(label + ": symbol is empty");
            continue;
        }

        auto side = parse_side(cell(table, "side", row));
        if (side.is_error()) {
            result.errors.push_back(label + ": " + side.error()->what());
            continue;
        }
        execution.side = side.value();

        auto quantity = DataConversionUtils::parse_number(cell(table, "quantity", row));
        if (quantity.is_error() || quantity.value() <= 0.0) {
            result.errors.push_back(label + ": quantity must be a positive number, got '" +
                                    cell(table, "quantity", row) + "'");
            continue;
        }
        execution.quantity = quantity.value();

        auto price = DataConversionUtils::parse_number(cell(table, "price", row));
        if (price.is_error() || price.value() < 0.0) {
            result.errors.push_back(label + ": price must be a non-negative number, got '" +
                                    cell(table, "price", row) + "'");
            continue;
        }
        execution.price = price.value();

        auto timestamp = core::parse_timestamp(cell(table, "timestamp", row));
        if (timestamp.is_error()) {
            result.errors.push_back(label + ": " + timestamp.error()->what());
            continue;
        }
        execution.timestamp = timestamp.value();

        const std::string fees_text = cell(table, "fees", row);
        if (!fees_text.empty()) {
            auto fees = DataConversionUtils::parse_number(fees_text);
            if (fees.is_error() || fees.value() < 0.0) {
                result.errors.push_back(label + ": fees must be a non-negative number, got '" +
                                        fees_text + "'");
                continue;
            }
            execution.fees = fees.value();
        }

        const std::string strategy_text = cell(table, "strategy_id", row);
        if (!strategy_text.empty()) {
            auto strategy = DataConversionUtils::parse_number(strategy_text);
            if (strategy.is_error() || strategy.value() < 1.0 ||
                strategy.value() > MAX_EXACT_STRATEGY_ID ||
                std::floor(strategy.value()) != strategy.value()) {
                result.errors.push_back(label + ": strategy_id must be a positive integer, got '" +
                                        strategy_text + "'");
                continue;
            }
            execution.strategy_id = static_cast<StrategyId>(strategy.value());
        }

        execution.order_type = cell(table, "order_type", row);
        if (execution.order_type.empty()) {
            execution.order_type = "MARKET";
        }
        execution.status = cell(table, "status", row);
        if (execution.status.empty()) {
            execution.status = "FILLED";
        }
        execution.notes = cell(table, "notes", row);

        result.executions.push_back(execution);
    }

    return Result<CsvParseResult>(std::move(result));
}

// ========== Webull Format ==========

Result<CsvParseResult> CsvTradeImporter::parse_webull(const StringTable& table) const {
    auto columns = require_columns(table, WEBULL_REQUIRED);
    if (columns.is_error()) {
        return forward_error<CsvParseResult>(columns);
    }

    CsvParseResult result;
    result.format = CsvFormat::WEBULL;

    for (int64_t row = 0; row < table.num_rows(); ++row) {
        const std::string label = row_label(row);
        const std::string status = cell(table, "Status", row);

        if (DataConversionUtils::to_lower(status) == "cancelled") {
            result.skipped_rows++;
            continue;
        }

        const std::string filled_text = cell(table, "Filled", row);
        double filled = 0.0;
        if (!filled_text.empty()) {
            auto parsed = DataConversionUtils::parse_number(filled_text);
            if (parsed.is_error() || parsed.value() < 0.0) {
                result.errors.push_back(label + ": invalid filled quantity '" + filled_text + "'");
                continue;
            }
            filled = parsed.value();
        }
        if (filled <= 0.0) {
            result.skipped_rows++;
            continue;
        }

        Execution execution;
        execution.symbol = cell(table, "Symbol", row);
        if (execution.symbol.empty()) {
            result.errors.push_back(label + ": symbol is empty");
            continue;
        }

        auto side = parse_side(cell(table, "Side", row));
        if (side.is_error()) {
            result.errors.push_back(label + ": " + side.error()->what());
            continue;
        }
        execution.side = side.value();
        execution.quantity = filled;

        // Average fill price when present, else the limit price
        double price = 0.0;
        auto avg_price = DataConversionUtils::parse_number(cell(table, "Avg Price", row));
        if (avg_price.is_ok()) {
            price = avg_price.value();
        } else {
            auto limit_price = DataConversionUtils::parse_number(cell(table, "Price", row));
            if (limit_price.is_ok()) {
                price = limit_price.value();
            }
        }
        if (price <= 0.0) {
            result.skipped_rows++;
            continue;
        }
        execution.price = price;

        auto timestamp = core::parse_timestamp(cell(table, "Filled Time", row));
        if (timestamp.is_error()) {
            timestamp = core::parse_timestamp(cell(table, "Placed Time", row));
        }
        if (timestamp.is_error()) {
            result.errors.push_back(label + ": no valid Filled Time or Placed Time");
            continue;
        }
        execution.timestamp = timestamp.value();

        for (const auto& fee_column : WEBULL_FEE_COLUMNS) {
            auto fees = DataConversionUtils::parse_number(cell(table, fee_column, row));
            if (fees.is_ok()) {
                execution.fees = std::abs(fees.value());
                break;
            }
        }

        execution.order_type = cell(table, "Time-in-Force", row);
        if (execution.order_type.empty()) {
            execution.order_type = "DAY";
        }
        execution.status = status;
        execution.notes = cell(table, "Name", row);

        result.executions.push_back(execution);
    }

    return Result<CsvParseResult>(std::move(result));
}

}  // namespace trade_journal
