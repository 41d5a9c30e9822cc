// include/trade_journal/data/postgres_trade_store.hpp

#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "trade_journal/core/error.hpp"
#include "trade_journal/core/types.hpp"
#include "trade_journal/data/trade_store.hpp"

namespace trade_journal {

/**
 * @brief Trade store backed by PostgreSQL
 *
 * Tables live in a configurable schema:
 *   <schema>.strategies (id, name, description)
 *   <schema>.executions (id, symbol, side, quantity, price, executed_at, fees,
 *                        strategy_id, order_type, status, notes)
 *
 * Snapshots are read in a single REPEATABLE READ, read-only transaction.
 * Imports and clears each run in one write transaction.
 */
class PostgresTradeStore : public TradeStore {
public:
    /**
     * @brief Constructor
     * @param connection_string libpq connection string
     * @param schema Schema holding the journal tables
     */
    PostgresTradeStore(std::string connection_string, std::string schema = "journal");

    ~PostgresTradeStore() override;

    PostgresTradeStore(const PostgresTradeStore&) = delete;
    PostgresTradeStore& operator=(const PostgresTradeStore&) = delete;
    PostgresTradeStore(PostgresTradeStore&&) = delete;
    PostgresTradeStore& operator=(PostgresTradeStore&&) = delete;

    /**
     * @brief Connect to the database
     * @return Result indicating success or failure
     */
    Result<void> connect();

    /**
     * @brief Disconnect from the database
     */
    void disconnect();

    bool is_connected() const;

    /**
     * @brief Create the schema and tables when missing
     */
    Result<void> initialize_schema();

    Result<SnapshotPtr> snapshot() const override;
    Result<ImportSummary> insert_executions(const std::vector<Execution>& executions) override;
    Result<StrategyId> add_strategy(const Strategy& strategy) override;
    Result<size_t> clear_all() override;

private:
    Result<void> validate_connection() const;
    std::string table(const std::string& name) const;

    std::string connection_string_;
    std::string schema_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace trade_journal
