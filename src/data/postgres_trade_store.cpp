// src/data/postgres_trade_store.cpp

#include "trade_journal/data/postgres_trade_store.hpp"
#include <optional>
#include <regex>
#include "trade_journal/core/logger.hpp"

namespace trade_journal {

namespace {

int64_t to_epoch_micros(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_micros(int64_t micros) {
    return Timestamp(
        std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros)));
}

std::optional<std::string> optional_text(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

PostgresTradeStore::PostgresTradeStore(std::string connection_string, std::string schema)
    : connection_string_(std::move(connection_string)),
      schema_(std::move(schema)),
      connection_(nullptr) {
    Logger::register_component("PostgresTradeStore");
}

PostgresTradeStore::~PostgresTradeStore() {
    disconnect();
}

Result<void> PostgresTradeStore::connect() {
    static const std::regex identifier(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
    if (!std::regex_match(schema_, identifier)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Invalid schema name: " + schema_,
                                "PostgresTradeStore");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresTradeStore");
        }
        INFO("Connected to PostgreSQL trade store, schema " << schema_);
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresTradeStore");
    }
}

void PostgresTradeStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        INFO("Disconnected from PostgreSQL trade store");
    }
    connection_.reset();
}

bool PostgresTradeStore::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresTradeStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresTradeStore");
    }
    return Result<void>();
}

std::string PostgresTradeStore::table(const std::string& name) const {
    return schema_ + "." + name;
}

Result<void> PostgresTradeStore::initialize_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec("CREATE SCHEMA IF NOT EXISTS " + schema_);
        txn.exec("CREATE TABLE IF NOT EXISTS " + table("strategies") +
                 " (id BIGSERIAL PRIMARY KEY,"
                 " name TEXT NOT NULL,"
                 " description TEXT NOT NULL DEFAULT '')");
        txn.exec("CREATE TABLE IF NOT EXISTS " + table("executions") +
                 " (id BIGSERIAL PRIMARY KEY,"
                 " symbol TEXT NOT NULL,"
                 " side TEXT NOT NULL CHECK (side IN ('BUY', 'SELL')),"
                 " quantity DOUBLE PRECISION NOT NULL CHECK (quantity > 0),"
                 " price DOUBLE PRECISION NOT NULL CHECK (price >= 0),"
                 " executed_at TIMESTAMPTZ NOT NULL,"
                 " fees DOUBLE PRECISION NOT NULL DEFAULT 0,"
                 " strategy_id BIGINT REFERENCES " +
                 table("strategies") +
                 "(id),"
                 " order_type TEXT,"
                 " status TEXT,"
                 " notes TEXT)");
        txn.exec("CREATE INDEX IF NOT EXISTS executions_symbol_time_idx ON " +
                 table("executions") + " (symbol, executed_at)");
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to initialize schema: " + std::string(e.what()),
                                "PostgresTradeStore");
    }
}

Result<SnapshotPtr> PostgresTradeStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<SnapshotPtr>(validation);
    }

    try {
        pqxx::transaction<pqxx::isolation_level::repeatable_read, pqxx::write_policy::read_only>
            txn(*connection_);

        auto snapshot = std::make_shared<TradeSnapshot>();

        auto strategies = txn.exec("SELECT id, name FROM " + table("strategies"));
        for (const auto& row : strategies) {
            snapshot->strategy_names[row[0].as<int64_t>()] = row[1].as<std::string>();
        }

        auto rows = txn.exec(
            "SELECT id, symbol, side, quantity, price,"
            " (EXTRACT(EPOCH FROM executed_at) * 1000000)::BIGINT,"
            " fees, strategy_id, order_type, status, notes FROM " +
            table("executions") + " ORDER BY executed_at, id");

        snapshot->executions.reserve(rows.size());
        for (const auto& row : rows) {
            auto side = parse_side(row[2].as<std::string>());
            if (side.is_error()) {
                return make_error<SnapshotPtr>(ErrorCode::INVALID_DATA,
                                               "Execution " + row[0].as<std::string>() + ": " +
                                                   side.error()->what(),
                                               "PostgresTradeStore");
            }

            Execution execution;
            execution.id = row[0].as<int64_t>();
            execution.symbol = row[1].as<std::string>();
            execution.side = side.value();
            execution.quantity = row[3].as<double>();
            execution.price = row[4].as<double>();
            execution.timestamp = from_epoch_micros(row[5].as<int64_t>());
            execution.fees = row[6].is_null() ? 0.0 : row[6].as<double>();
            if (!row[7].is_null()) {
                execution.strategy_id = row[7].as<int64_t>();
            }
            execution.order_type = row[8].is_null() ? "" : row[8].as<std::string>();
            execution.status = row[9].is_null() ? "" : row[9].as<std::string>();
            execution.notes = row[10].is_null() ? "" : row[10].as<std::string>();
            snapshot->executions.push_back(std::move(execution));
        }
        txn.commit();

        // Row count and last id change whenever the contents do
        if (!snapshot->executions.empty()) {
            snapshot->version = (static_cast<uint64_t>(snapshot->executions.size()) << 32) ^
                                static_cast<uint64_t>(snapshot->executions.back().id);
        }
        return Result<SnapshotPtr>(SnapshotPtr(std::move(snapshot)));

    } catch (const std::exception& e) {
        return make_error<SnapshotPtr>(ErrorCode::DATABASE_ERROR,
                                       "Failed to read trade snapshot: " + std::string(e.what()),
                                       "PostgresTradeStore");
    }
}

Result<ImportSummary> PostgresTradeStore::insert_executions(
    const std::vector<Execution>& executions) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<ImportSummary>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        ImportSummary summary;

        const std::string duplicate_query =
            "SELECT COUNT(*) FROM " + table("executions") +
            " WHERE symbol = $1 AND side = $2 AND quantity = $3 AND price = $4"
            " AND executed_at = to_timestamp($5::BIGINT / 1000000.0)";
        const std::string insert_query =
            "INSERT INTO " + table("executions") +
            " (symbol, side, quantity, price, executed_at, fees, strategy_id, order_type,"
            " status, notes) VALUES ($1, $2, $3, $4, to_timestamp($5::BIGINT / 1000000.0),"
            " $6, $7, $8, $9, $10) RETURNING id";

        for (const auto& execution : executions) {
            const std::string side = side_to_string(execution.side);
            const int64_t micros = to_epoch_micros(execution.timestamp);

            auto existing = txn.exec_params(duplicate_query, execution.symbol, side,
                                            execution.quantity, execution.price, micros);
            if (existing[0][0].as<int64_t>() > 0) {
                ++summary.skipped_duplicates;
                continue;
            }

            auto inserted = txn.exec_params(
                insert_query, execution.symbol, side, execution.quantity, execution.price, micros,
                execution.fees, execution.strategy_id, optional_text(execution.order_type),
                optional_text(execution.status), optional_text(execution.notes));
            summary.imported_ids.push_back(inserted[0][0].as<int64_t>());
        }

        txn.commit();
        DEBUG("Inserted " << summary.imported_ids.size() << " executions, skipped "
                          << summary.skipped_duplicates << " duplicates");
        return Result<ImportSummary>(summary);

    } catch (const std::exception& e) {
        return make_error<ImportSummary>(ErrorCode::DATABASE_ERROR,
                                         "Failed to store executions: " + std::string(e.what()),
                                         "PostgresTradeStore");
    }
}

Result<StrategyId> PostgresTradeStore::add_strategy(const Strategy& strategy) {
    if (strategy.name.empty()) {
        return make_error<StrategyId>(ErrorCode::INVALID_ARGUMENT, "Strategy name cannot be empty",
                                      "PostgresTradeStore");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<StrategyId>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto inserted = txn.exec_params("INSERT INTO " + table("strategies") +
                                            " (name, description) VALUES ($1, $2) RETURNING id",
                                        strategy.name, strategy.description);
        txn.commit();
        return Result<StrategyId>(inserted[0][0].as<int64_t>());
    } catch (const std::exception& e) {
        return make_error<StrategyId>(ErrorCode::DATABASE_ERROR,
                                      "Failed to store strategy: " + std::string(e.what()),
                                      "PostgresTradeStore");
    }
}

Result<size_t> PostgresTradeStore::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<size_t>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto result = txn.exec("DELETE FROM " + table("executions"));
        txn.commit();
        INFO("Cleared " << result.affected_rows() << " executions");
        return Result<size_t>(static_cast<size_t>(result.affected_rows()));
    } catch (const std::exception& e) {
        return make_error<size_t>(ErrorCode::DATABASE_ERROR,
                                  "Failed to clear executions: " + std::string(e.what()),
                                  "PostgresTradeStore");
    }
}

}  // namespace trade_journal
