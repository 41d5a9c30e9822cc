// include/trade_journal/config/engine_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trade_journal/core/config_base.hpp"
#include "trade_journal/core/error.hpp"
#include "trade_journal/core/logger.hpp"
#include "trade_journal/core/types.hpp"

namespace trade_journal {

/**
 * @brief Connection settings for the PostgreSQL trade store
 */
struct DatabaseConfig : public ConfigBase {
    bool enabled{false};
    std::string connection_string;
    std::string schema{"journal"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Tunables for the pairing and analytics engine
 *
 * Serialized documents carry a "version" field and are upgraded through
 * ConfigVersionManager before being read.
 */
struct EngineConfig : public ConfigBase {
    static constexpr const char* CURRENT_VERSION = "1.1.0";

    PairingMethod default_pairing_method{PairingMethod::FIFO};

    // Lot matching
    double quantity_epsilon{1e-4};
    double option_multiplier{100.0};

    // Distribution
    int histogram_bins{20};
    double default_concentration_percent{10.0};

    // Tilt
    int tilt_max_streak{4};
    int tilt_min_sample{10};
    int tilt_min_total_trades{10};
    double tilt_win_drop_threshold{0.15};

    // strategy_* metric fields ignore the request date range unless set
    bool strategy_metrics_respect_date_filter{false};

    // Calendar buckets are computed in UTC shifted by this many minutes
    int session_utc_offset_minutes{0};

    int recent_trades_default_limit{5};

    DatabaseConfig database;
    LoggerConfig logger;

    std::string version{CURRENT_VERSION};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Check every field against its allowed range
     * @return INVALID_ARGUMENT naming each offending field
     */
    Result<void> validate() const;

    /**
     * @brief Upgrade a raw document and load it
     *
     * Registers the engine migrations on first use, migrates the document
     * to CURRENT_VERSION, then loads and validates it.
     */
    static Result<EngineConfig> from_versioned_json(nlohmann::json document);

    /**
     * @brief Read, migrate and validate a configuration file
     */
    static Result<EngineConfig> load(const std::string& filepath);
};

/**
 * @brief Register the engine config migration chain with ConfigVersionManager
 *
 * Safe to call repeatedly.
 */
Result<void> register_engine_config_migrations();

}  // namespace trade_journal
