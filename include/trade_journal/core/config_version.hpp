// include/trade_journal/core/config_version.hpp
#pragma once

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trade_journal/core/error.hpp"

namespace trade_journal {

/**
 * @brief Kinds of versioned configuration documents
 */
enum class ConfigType { ENGINE, PREFERENCES };

std::string config_type_to_string(ConfigType type);

/**
 * @brief Semantic version for configuration
 */
struct ConfigVersion {
    int major{0};
    int minor{0};
    int patch{0};

    std::string to_string() const;

    /**
     * @brief Parse "MAJOR.MINOR.PATCH"
     * @throws std::runtime_error on malformed input
     */
    static ConfigVersion from_string(const std::string& version_str);

    bool operator<(const ConfigVersion& other) const;
    bool operator==(const ConfigVersion& other) const;

    bool operator<=(const ConfigVersion& other) const {
        return *this < other || *this == other;
    }
};

/**
 * @brief Migration function type
 */
using MigrationFunction = std::function<Result<nlohmann::json>(const nlohmann::json&)>;

/**
 * @brief Configuration migration definition
 */
struct MigrationStep {
    ConfigVersion from_version;
    ConfigVersion to_version;
    MigrationFunction migrate;
    std::string description;
};

/**
 * @brief Migration plan for a series of upgrades
 */
struct MigrationPlan {
    std::vector<MigrationStep> steps;
    ConfigVersion start_version;
    ConfigVersion target_version;
};

/**
 * @brief Migration result including changes made
 */
struct MigrationResult {
    bool success{false};
    ConfigVersion original_version;
    ConfigVersion final_version;
    std::vector<std::string> changes;
    std::vector<std::string> warnings;
};

/**
 * @brief Registry of versioned migrations, one chain per configuration type
 *
 * Documents carry their version in a top-level "version" string. Migrations
 * are applied in version order, each step rewriting the document and
 * stamping the new version.
 */
class ConfigVersionManager {
public:
    static ConfigVersionManager& instance() {
        static ConfigVersionManager instance;
        return instance;
    }

    /**
     * @brief Register a migration step
     * @param component_type Configuration type the step applies to
     * @param from_version Starting version
     * @param to_version Target version
     * @param migration Migration function
     * @param description Description of changes
     * @return Result indicating success or failure
     */
    Result<void> register_migration(ConfigType component_type, const ConfigVersion& from_version,
                                    const ConfigVersion& to_version, MigrationFunction migration,
                                    const std::string& description);

    bool has_migrations(ConfigType component_type) const;

    /**
     * @brief Latest version reachable for a component, 1.0.0 when none is registered
     */
    ConfigVersion get_latest_version(ConfigType component_type) const;

    bool needs_migration(const nlohmann::json& config, ConfigType component_type) const;

    /**
     * @brief Create migration plan
     * @param component_type Configuration type
     * @param from_version Starting version
     * @param to_version Target version
     * @return Migration plan, or an error when no complete chain exists
     */
    Result<MigrationPlan> create_migration_plan(ConfigType component_type,
                                                const ConfigVersion& from_version,
                                                const ConfigVersion& to_version) const;

    /**
     * @brief Execute migration plan
     * @param config Configuration to migrate, updated in place
     * @param plan Migration plan to execute
     * @return Migration result
     */
    Result<MigrationResult> execute_migration(nlohmann::json& config,
                                              const MigrationPlan& plan) const;

    /**
     * @brief Automatically migrate config to latest version
     * @param config Configuration to migrate
     * @param component_type Component type
     * @return Migration result
     */
    Result<MigrationResult> auto_migrate(nlohmann::json& config, ConfigType component_type) const;

    /**
     * @brief Reset the manager's state (for testing)
     */
    static void reset_instance() {
        instance().migrations_.clear();
        instance().latest_versions_.clear();
    }

private:
    ConfigVersionManager() = default;

    // Steps by component type, keyed "from_to"
    std::map<ConfigType, std::map<std::string, MigrationStep>> migrations_;
    std::map<ConfigType, ConfigVersion> latest_versions_;

    Result<ConfigVersion> get_config_version(const nlohmann::json& config) const;
    Result<void> validate_migration_step(const MigrationStep& step) const;

    static std::string make_version_key(const ConfigVersion& from_version,
                                        const ConfigVersion& to_version);
};

}  // namespace trade_journal
