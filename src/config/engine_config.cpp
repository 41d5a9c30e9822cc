// src/config/engine_config.cpp
#include "trade_journal/config/engine_config.hpp"
#include <fstream>
#include <vector>
#include "trade_journal/core/config_version.hpp"

namespace trade_journal {

namespace {

template <typename T>
void read_if_present(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j.at(key).get<T>();
    }
}

void rename_key(nlohmann::json& j, const char* old_key, const char* new_key) {
    if (j.contains(old_key) && !j.contains(new_key)) {
        j[new_key] = j[old_key];
    }
    j.erase(old_key);
}

}  // namespace

nlohmann::json DatabaseConfig::to_json() const {
    nlohmann::json j;
    j["enabled"] = enabled;
    j["connection_string"] = connection_string;
    j["schema"] = schema;
    return j;
}

void DatabaseConfig::from_json(const nlohmann::json& j) {
    read_if_present(j, "enabled", enabled);
    read_if_present(j, "connection_string", connection_string);
    read_if_present(j, "schema", schema);
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["version"] = version;
    j["default_pairing_method"] = pairing_method_to_string(default_pairing_method);
    j["quantity_epsilon"] = quantity_epsilon;
    j["option_multiplier"] = option_multiplier;
    j["histogram_bins"] = histogram_bins;
    j["default_concentration_percent"] = default_concentration_percent;
    j["tilt_max_streak"] = tilt_max_streak;
    j["tilt_min_sample"] = tilt_min_sample;
    j["tilt_min_total_trades"] = tilt_min_total_trades;
    j["tilt_win_drop_threshold"] = tilt_win_drop_threshold;
    j["strategy_metrics_respect_date_filter"] = strategy_metrics_respect_date_filter;
    j["session_utc_offset_minutes"] = session_utc_offset_minutes;
    j["recent_trades_default_limit"] = recent_trades_default_limit;
    j["database"] = database.to_json();
    j["logger"] = logger.to_json();
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("default_pairing_method")) {
        auto method = parse_pairing_method(j.at("default_pairing_method").get<std::string>());
        if (method.is_error()) {
            throw *method.error();
        }
        default_pairing_method = method.value();
    }
    read_if_present(j, "quantity_epsilon", quantity_epsilon);
    read_if_present(j, "option_multiplier", option_multiplier);
    read_if_present(j, "histogram_bins", histogram_bins);
    read_if_present(j, "default_concentration_percent", default_concentration_percent);
    read_if_present(j, "tilt_max_streak", tilt_max_streak);
    read_if_present(j, "tilt_min_sample", tilt_min_sample);
    read_if_present(j, "tilt_min_total_trades", tilt_min_total_trades);
    read_if_present(j, "tilt_win_drop_threshold", tilt_win_drop_threshold);
    read_if_present(j, "strategy_metrics_respect_date_filter",
                    strategy_metrics_respect_date_filter);
    read_if_present(j, "session_utc_offset_minutes", session_utc_offset_minutes);
    read_if_present(j, "recent_trades_default_limit", recent_trades_default_limit);
    read_if_present(j, "version", version);
    if (j.contains("database")) {
        database.from_json(j.at("database"));
    }
    if (j.contains("logger")) {
        logger.from_json(j.at("logger"));
    }
}

Result<void> EngineConfig::validate() const {
    std::vector<std::string> problems;

    if (!(quantity_epsilon > 0.0 && quantity_epsilon < 1.0)) {
        problems.push_back("quantity_epsilon must be in (0, 1)");
    }
    if (option_multiplier <= 0.0) {
        problems.push_back("option_multiplier must be positive");
    }
    if (histogram_bins < 1) {
        problems.push_back("histogram_bins must be at least 1");
    }
    if (default_concentration_percent < 5.0 || default_concentration_percent > 30.0) {
        problems.push_back("default_concentration_percent must be within [5, 30]");
    }
    if (tilt_max_streak < 1) {
        problems.push_back("tilt_max_streak must be at least 1");
    }
    if (tilt_min_sample < 1) {
        problems.push_back("tilt_min_sample must be at least 1");
    }
    if (tilt_min_total_trades < 0) {
        problems.push_back("tilt_min_total_trades cannot be negative");
    }
    if (tilt_win_drop_threshold <= 0.0 || tilt_win_drop_threshold >= 1.0) {
        problems.push_back("tilt_win_drop_threshold must be in (0, 1)");
    }
    if (session_utc_offset_minutes < -14 * 60 || session_utc_offset_minutes > 14 * 60) {
        problems.push_back("session_utc_offset_minutes must be within +/-840");
    }
    if (recent_trades_default_limit < 0) {
        problems.push_back("recent_trades_default_limit cannot be negative");
    }
    if (database.enabled && database.connection_string.empty()) {
        problems.push_back("database.connection_string is required when database.enabled");
    }

    if (problems.empty()) {
        return Result<void>();
    }

    std::string message = "Invalid engine config:";
    for (const auto& problem : problems) {
        message += " " + problem + ";";
    }
    return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "EngineConfig");
}

Result<EngineConfig> EngineConfig::from_versioned_json(nlohmann::json document) {
    auto registered = register_engine_config_migrations();
    if (registered.is_error()) {
        return forward_error<EngineConfig>(registered, "EngineConfig");
    }

    auto migrated = ConfigVersionManager::instance().auto_migrate(document, ConfigType::ENGINE);
    if (migrated.is_error()) {
        return forward_error<EngineConfig>(migrated, "EngineConfig");
    }
    for (const auto& change : migrated.value().changes) {
        INFO("Engine config " << change);
    }

    EngineConfig config;
    try {
        config.from_json(document);
    } catch (const JournalError& e) {
        return make_error<EngineConfig>(e.code(), e.what(), "EngineConfig");
    } catch (const nlohmann::json::exception& e) {
        return make_error<EngineConfig>(ErrorCode::JSON_PARSE_ERROR,
                                        std::string("Malformed engine config: ") + e.what(),
                                        "EngineConfig");
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<EngineConfig>(valid);
    }
    return Result<EngineConfig>(config);
}

Result<EngineConfig> EngineConfig::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<EngineConfig>(ErrorCode::FILE_NOT_FOUND,
                                        "Failed to open config file: " + filepath, "EngineConfig");
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        return make_error<EngineConfig>(ErrorCode::JSON_PARSE_ERROR,
                                        "Error parsing " + filepath + ": " + e.what(),
                                        "EngineConfig");
    }
    return from_versioned_json(std::move(document));
}

Result<void> register_engine_config_migrations() {
    auto& manager = ConfigVersionManager::instance();
    if (manager.has_migrations(ConfigType::ENGINE)) {
        return Result<void>();
    }

    return manager.register_migration(
        ConfigType::ENGINE, ConfigVersion{1, 0, 0}, ConfigVersion{1, 1, 0},
        [](const nlohmann::json& config) -> Result<nlohmann::json> {
            nlohmann::json upgraded = config;
            rename_key(upgraded, "pairing_method", "default_pairing_method");
            rename_key(upgraded, "min_sample", "tilt_min_sample");
            rename_key(upgraded, "bins", "histogram_bins");
            return Result<nlohmann::json>(upgraded);
        },
        "Prefix tuning keys with their analyzer");
}

}  // namespace trade_journal
