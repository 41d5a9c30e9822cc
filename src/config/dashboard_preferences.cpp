// src/config/dashboard_preferences.cpp
#include "trade_journal/config/dashboard_preferences.hpp"
#include <set>
#include <sstream>
#include "trade_journal/core/config_version.hpp"

namespace trade_journal {

namespace {

constexpr const char* GOOD_SUFFIX = "_good";
constexpr const char* BAD_SUFFIX = "_bad";

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() > suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_sections(const std::string& joined) {
    std::vector<std::string> sections;
    std::stringstream ss(joined);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto first = item.find_first_not_of(' ');
        const auto last = item.find_last_not_of(' ');
        if (first != std::string::npos) {
            sections.push_back(item.substr(first, last - first + 1));
        }
    }
    return sections;
}

// 1.0.0 stored a list of hidden metric keys
Result<nlohmann::json> migrate_hidden_metrics(const nlohmann::json& config) {
    nlohmann::json upgraded = config;
    nlohmann::json visibility = nlohmann::json::object();
    if (upgraded.contains("hidden_metrics")) {
        if (!upgraded["hidden_metrics"].is_array()) {
            return make_error<nlohmann::json>(ErrorCode::INVALID_DATA,
                                              "hidden_metrics must be an array",
                                              "DashboardPreferences");
        }
        for (const auto& metric : upgraded["hidden_metrics"]) {
            visibility[metric.get<std::string>()] = false;
        }
        upgraded.erase("hidden_metrics");
    }
    upgraded["metric_visibility"] = visibility;
    return Result<nlohmann::json>(upgraded);
}

// 1.1.0 stored section order as "a,b,c" and thresholds as flat <metric>_good/<metric>_bad keys
Result<nlohmann::json> migrate_sections_and_thresholds(const nlohmann::json& config) {
    nlohmann::json upgraded = nlohmann::json::object();
    nlohmann::json thresholds = nlohmann::json::object();

    for (auto it = config.begin(); it != config.end(); ++it) {
        const std::string& key = it.key();
        if (it.value().is_number() && ends_with(key, GOOD_SUFFIX)) {
            thresholds[key.substr(0, key.size() - 5)]["good"] = it.value();
        } else if (it.value().is_number() && ends_with(key, BAD_SUFFIX)) {
            thresholds[key.substr(0, key.size() - 4)]["bad"] = it.value();
        } else if (key == "section_order" && it.value().is_string()) {
            upgraded["section_order"] = split_sections(it.value().get<std::string>());
        } else {
            upgraded[key] = it.value();
        }
    }

    if (!thresholds.empty()) {
        upgraded["color_thresholds"] = thresholds;
    }
    return Result<nlohmann::json>(upgraded);
}

}  // namespace

DashboardPreferences DashboardPreferences::defaults() {
    DashboardPreferences prefs;
    for (const char* metric : {"win_rate", "profit_factor", "expectancy", "max_drawdown",
                               "sharpe_ratio", "trades_per_day", "tilt_score", "stability_score"}) {
        prefs.metric_visibility[metric] = true;
    }
    prefs.section_order = {"summary",      "equity_curve", "calendar", "evaluation",
                           "distribution", "tilt",         "recent_trades"};
    prefs.color_thresholds["win_rate"] = ColorThreshold{0.55, 0.45};
    prefs.color_thresholds["profit_factor"] = ColorThreshold{1.5, 1.0};
    prefs.color_thresholds["tilt_score"] = ColorThreshold{3.0, 7.0};
    prefs.color_thresholds["stability_score"] = ColorThreshold{80.0, 50.0};
    return prefs;
}

nlohmann::json DashboardPreferences::to_json() const {
    nlohmann::json j;
    j["version"] = schema_version;
    j["metric_visibility"] = metric_visibility;
    j["section_order"] = section_order;
    nlohmann::json thresholds = nlohmann::json::object();
    for (const auto& [metric, threshold] : color_thresholds) {
        thresholds[metric] = {{"good", threshold.good}, {"bad", threshold.bad}};
    }
    j["color_thresholds"] = thresholds;
    return j;
}

void DashboardPreferences::from_json(const nlohmann::json& j) {
    if (j.contains("version"))
        schema_version = j.at("version").get<std::string>();
    if (j.contains("metric_visibility"))
        metric_visibility = j.at("metric_visibility").get<std::map<std::string, bool>>();
    if (j.contains("section_order"))
        section_order = j.at("section_order").get<std::vector<std::string>>();
    if (j.contains("color_thresholds")) {
        color_thresholds.clear();
        for (auto it = j.at("color_thresholds").begin(); it != j.at("color_thresholds").end();
             ++it) {
            ColorThreshold threshold;
            threshold.good = it.value().value("good", 0.0);
            threshold.bad = it.value().value("bad", 0.0);
            color_thresholds[it.key()] = threshold;
        }
    }
}

bool DashboardPreferences::is_visible(const std::string& metric) const {
    auto it = metric_visibility.find(metric);
    return it == metric_visibility.end() || it->second;
}

Result<void> DashboardPreferences::validate() const {
    std::set<std::string> seen;
    for (const auto& section : section_order) {
        if (section.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Section names cannot be empty",
                                    "DashboardPreferences");
        }
        if (!seen.insert(section).second) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Section listed twice: " + section, "DashboardPreferences");
        }
    }
    for (const auto& [metric, visible] : metric_visibility) {
        if (metric.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Metric keys cannot be empty",
                                    "DashboardPreferences");
        }
    }
    return Result<void>();
}

std::vector<std::string> DashboardPreferences::diff(const DashboardPreferences& other) const {
    std::vector<std::string> changed;
    if (metric_visibility != other.metric_visibility)
        changed.push_back("metric_visibility");
    if (section_order != other.section_order)
        changed.push_back("section_order");
    if (color_thresholds != other.color_thresholds)
        changed.push_back("color_thresholds");
    return changed;
}

Result<void> register_preferences_migrations() {
    auto& manager = ConfigVersionManager::instance();
    if (manager.has_migrations(ConfigType::PREFERENCES)) {
        return Result<void>();
    }

    auto first = manager.register_migration(ConfigType::PREFERENCES, ConfigVersion{1, 0, 0},
                                            ConfigVersion{1, 1, 0}, migrate_hidden_metrics,
                                            "Replace hidden_metrics list with metric_visibility");
    if (first.is_error()) {
        return first;
    }

    return manager.register_migration(
        ConfigType::PREFERENCES, ConfigVersion{1, 1, 0}, ConfigVersion{2, 0, 0},
        migrate_sections_and_thresholds,
        "Store section_order as a list and group color thresholds per metric");
}

}  // namespace trade_journal
