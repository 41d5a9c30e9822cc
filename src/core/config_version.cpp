// src/core/config_version.cpp
#include "trade_journal/core/config_version.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>

namespace trade_journal {

std::string config_type_to_string(ConfigType type) {
    switch (type) {
        case ConfigType::ENGINE:
            return "ENGINE";
        case ConfigType::PREFERENCES:
            return "PREFERENCES";
        default:
            return "UNKNOWN";
    }
}

std::string ConfigVersion::to_string() const {
    std::stringstream ss;
    ss << major << "." << minor << "." << patch;
    return ss.str();
}

ConfigVersion ConfigVersion::from_string(const std::string& version_str) {
    static const std::regex version_regex(R"((\d+)\.(\d+)\.(\d+))");
    std::smatch matches;

    if (!std::regex_match(version_str, matches, version_regex)) {
        throw std::runtime_error("Invalid version string: " + version_str);
    }

    return ConfigVersion{std::stoi(matches[1].str()), std::stoi(matches[2].str()),
                         std::stoi(matches[3].str())};
}

bool ConfigVersion::operator<(const ConfigVersion& other) const {
    if (major != other.major)
        return major < other.major;
    if (minor != other.minor)
        return minor < other.minor;
    return patch < other.patch;
}

bool ConfigVersion::operator==(const ConfigVersion& other) const {
    return major == other.major && minor == other.minor && patch == other.patch;
}

Result<void> ConfigVersionManager::register_migration(ConfigType component_type,
                                                      const ConfigVersion& from_version,
                                                      const ConfigVersion& to_version,
                                                      MigrationFunction migration,
                                                      const std::string& description) {
    MigrationStep step{from_version, to_version, std::move(migration), description};

    auto validation = validate_migration_step(step);
    if (validation.is_error()) {
        return validation;
    }

    migrations_[component_type][make_version_key(from_version, to_version)] = std::move(step);

    auto latest = latest_versions_.find(component_type);
    if (latest == latest_versions_.end() || latest->second < to_version) {
        latest_versions_[component_type] = to_version;
    }

    return Result<void>();
}

bool ConfigVersionManager::has_migrations(ConfigType component_type) const {
    auto it = migrations_.find(component_type);
    return it != migrations_.end() && !it->second.empty();
}

ConfigVersion ConfigVersionManager::get_latest_version(ConfigType component_type) const {
    auto it = latest_versions_.find(component_type);
    if (it != latest_versions_.end()) {
        return it->second;
    }
    return ConfigVersion{1, 0, 0};
}

bool ConfigVersionManager::needs_migration(const nlohmann::json& config,
                                           ConfigType component_type) const {
    auto version_result = get_config_version(config);
    if (version_result.is_error()) {
        return has_migrations(component_type);
    }
    return version_result.value() < get_latest_version(component_type);
}

Result<MigrationPlan> ConfigVersionManager::create_migration_plan(
    ConfigType component_type, const ConfigVersion& from_version,
    const ConfigVersion& to_version) const {
    MigrationPlan plan;
    plan.start_version = from_version;
    plan.target_version = to_version;

    if (from_version == to_version) {
        return Result<MigrationPlan>(plan);
    }

    if (to_version < from_version) {
        return make_error<MigrationPlan>(ErrorCode::INVALID_ARGUMENT,
                                         "Cannot migrate from " + from_version.to_string() +
                                             " down to " + to_version.to_string(),
                                         "ConfigVersionManager");
    }

    auto comp_migrations = migrations_.find(component_type);
    if (comp_migrations == migrations_.end()) {
        return make_error<MigrationPlan>(
            ErrorCode::INVALID_ARGUMENT,
            "No migrations registered for " + config_type_to_string(component_type),
            "ConfigVersionManager");
    }

    // Walk forward, taking the longest hop from each version that stays within the target
    ConfigVersion current = from_version;
    while (current < to_version) {
        const MigrationStep* best = nullptr;
        for (const auto& [key, step] : comp_migrations->second) {
            if (step.from_version == current && step.to_version <= to_version &&
                (best == nullptr || best->to_version < step.to_version)) {
                best = &step;
            }
        }

        if (best == nullptr) {
            return make_error<MigrationPlan>(ErrorCode::INVALID_ARGUMENT,
                                             "No migration path from " + current.to_string() +
                                                 " to " + to_version.to_string(),
                                             "ConfigVersionManager");
        }

        plan.steps.push_back(*best);
        current = best->to_version;
    }

    return Result<MigrationPlan>(plan);
}

Result<MigrationResult> ConfigVersionManager::execute_migration(nlohmann::json& config,
                                                                const MigrationPlan& plan) const {
    MigrationResult result;
    result.original_version = plan.start_version;
    result.final_version = plan.start_version;

    // Work on a copy so a failed step leaves the caller's document untouched
    nlohmann::json working = config;

    for (const auto& step : plan.steps) {
        const std::string hop = step.from_version.to_string() + " to " +
                                step.to_version.to_string();
        try {
            auto migration_result = step.migrate(working);
            if (migration_result.is_error()) {
                return make_error<MigrationResult>(
                    migration_result.error()->code(),
                    "Error migrating from " + hop + ": " + migration_result.error()->what(),
                    "ConfigVersionManager");
            }

            working = migration_result.value();
            working["version"] = step.to_version.to_string();
            result.changes.push_back("Migrated from " + hop + ": " + step.description);
            result.final_version = step.to_version;

        } catch (const std::exception& e) {
            return make_error<MigrationResult>(
                ErrorCode::UNKNOWN_ERROR,
                "Exception migrating from " + hop + ": " + std::string(e.what()),
                "ConfigVersionManager");
        }
    }

    config = std::move(working);
    result.success = true;
    return Result<MigrationResult>(result);
}

Result<MigrationResult> ConfigVersionManager::auto_migrate(nlohmann::json& config,
                                                           ConfigType component_type) const {
    ConfigVersion current_version{1, 0, 0};
    std::vector<std::string> warnings;

    auto version_result = get_config_version(config);
    if (version_result.is_error()) {
        // Documents written before versioning was introduced are treated as 1.0.0
        config["version"] = current_version.to_string();
        warnings.push_back("No version field, assuming 1.0.0");
    } else {
        current_version = version_result.value();
    }

    ConfigVersion latest_version = get_latest_version(component_type);
    if (latest_version <= current_version) {
        return Result<MigrationResult>(
            MigrationResult{true, current_version, current_version, {}, warnings});
    }

    auto plan_result = create_migration_plan(component_type, current_version, latest_version);
    if (plan_result.is_error()) {
        return forward_error<MigrationResult>(plan_result, "ConfigVersionManager");
    }

    auto migrated = execute_migration(config, plan_result.value());
    if (migrated.is_error()) {
        return migrated;
    }

    MigrationResult result = migrated.value();
    result.warnings.insert(result.warnings.begin(), warnings.begin(), warnings.end());
    return Result<MigrationResult>(result);
}

Result<ConfigVersion> ConfigVersionManager::get_config_version(
    const nlohmann::json& config) const {
    if (!config.is_object() || !config.contains("version") || !config["version"].is_string()) {
        return make_error<ConfigVersion>(ErrorCode::INVALID_ARGUMENT, "No version field in config",
                                         "ConfigVersionManager");
    }

    try {
        return Result<ConfigVersion>(
            ConfigVersion::from_string(config["version"].get<std::string>()));
    } catch (const std::exception& e) {
        return make_error<ConfigVersion>(ErrorCode::INVALID_ARGUMENT,
                                         std::string("Error parsing version: ") + e.what(),
                                         "ConfigVersionManager");
    }
}

Result<void> ConfigVersionManager::validate_migration_step(const MigrationStep& step) const {
    if (step.from_version == step.to_version) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "From and to versions cannot be the same",
                                "ConfigVersionManager");
    }

    if (step.to_version < step.from_version) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "To version must be greater than from version",
                                "ConfigVersionManager");
    }

    if (!step.migrate) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Migration function cannot be null",
                                "ConfigVersionManager");
    }

    return Result<void>();
}

std::string ConfigVersionManager::make_version_key(const ConfigVersion& from_version,
                                                   const ConfigVersion& to_version) {
    return from_version.to_string() + "_" + to_version.to_string();
}

}  // namespace trade_journal
