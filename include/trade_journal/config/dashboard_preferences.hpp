// include/trade_journal/config/dashboard_preferences.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trade_journal/core/config_base.hpp"
#include "trade_journal/core/error.hpp"

namespace trade_journal {

/**
 * @brief Value bands used to color a metric on the dashboard
 *
 * A value at or above good is shown as good, at or below bad as bad.
 * For metrics where lower is better, good is below bad.
 */
struct ColorThreshold {
    double good{0.0};
    double bad{0.0};

    bool operator==(const ColorThreshold& other) const {
        return good == other.good && bad == other.bad;
    }
};

/**
 * @brief Presentation preferences consumed by the view layer
 *
 * The engine never interprets section_order; it is stored and returned
 * in the order the user arranged it.
 */
struct DashboardPreferences : public ConfigBase {
    static constexpr const char* CURRENT_VERSION = "2.0.0";

    std::string schema_version{CURRENT_VERSION};
    std::map<std::string, bool> metric_visibility;
    std::vector<std::string> section_order;
    std::map<std::string, ColorThreshold> color_thresholds;

    /**
     * @brief Preferences used when nothing has been saved yet
     */
    static DashboardPreferences defaults();

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Visibility of a metric, visible unless explicitly hidden
     */
    bool is_visible(const std::string& metric) const;

    /**
     * @brief Reject duplicate section names and empty metric keys
     */
    Result<void> validate() const;

    /**
     * @brief Names of the top-level fields that differ from another instance
     */
    std::vector<std::string> diff(const DashboardPreferences& other) const;
};

/**
 * @brief Register the preferences migration chain (1.0.0 -> 1.1.0 -> 2.0.0)
 *
 * Safe to call repeatedly.
 */
Result<void> register_preferences_migrations();

}  // namespace trade_journal
