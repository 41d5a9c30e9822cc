// src/config/preferences_store.cpp
#include "trade_journal/config/preferences_store.hpp"
#include <filesystem>
#include <fstream>
#include "trade_journal/core/config_version.hpp"
#include "trade_journal/core/logger.hpp"

namespace trade_journal {

PreferencesStore::PreferencesStore(std::string filepath)
    : filepath_(std::move(filepath)), preferences_(DashboardPreferences::defaults()) {}

Result<void> PreferencesStore::load() {
    Logger::register_component("PreferencesStore");

    auto registered = register_preferences_migrations();
    if (registered.is_error()) {
        return registered;
    }

    if (filepath_.empty() || !std::filesystem::exists(filepath_)) {
        std::lock_guard<std::mutex> lock(mutex_);
        preferences_ = DashboardPreferences::defaults();
        return Result<void>();
    }

    nlohmann::json document;
    {
        std::ifstream file(filepath_);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open preferences: " + filepath_,
                                    "PreferencesStore");
        }
        try {
            file >> document;
        } catch (const nlohmann::json::exception& e) {
            return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                    "Malformed preferences file " + filepath_ + ": " + e.what(),
                                    "PreferencesStore");
        }
    }

    auto migrated =
        ConfigVersionManager::instance().auto_migrate(document, ConfigType::PREFERENCES);
    if (migrated.is_error()) {
        return forward_error<void>(migrated, "PreferencesStore");
    }

    // Start from defaults so sections added in later versions are present
    DashboardPreferences loaded = DashboardPreferences::defaults();
    try {
        loaded.from_json(document);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                std::string("Invalid preferences: ") + e.what(),
                                "PreferencesStore");
    }

    auto valid = loaded.validate();
    if (valid.is_error()) {
        return valid;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        preferences_ = loaded;
    }

    const auto& changes = migrated.value().changes;
    if (!changes.empty()) {
        for (const auto& change : changes) {
            INFO("Preferences " << change);
        }
        auto saved = loaded.save_to_file(filepath_);
        if (saved.is_error()) {
            return saved;
        }
    }
    return Result<void>();
}

DashboardPreferences PreferencesStore::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return preferences_;
}

Result<void> PreferencesStore::update(
    const std::function<void(DashboardPreferences&)>& mutator) {
    if (!mutator) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Mutator cannot be null",
                                "PreferencesStore");
    }
    DashboardPreferences next = get();
    mutator(next);
    return commit(std::move(next));
}

Result<void> PreferencesStore::replace(const DashboardPreferences& preferences) {
    return commit(preferences);
}

Result<void> PreferencesStore::commit(DashboardPreferences next) {
    next.schema_version = DashboardPreferences::CURRENT_VERSION;

    auto valid = next.validate();
    if (valid.is_error()) {
        return valid;
    }

    PreferencesChange change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        change.changed_fields = preferences_.diff(next);
        if (change.changed_fields.empty()) {
            return Result<void>();
        }

        if (!filepath_.empty()) {
            auto saved = next.save_to_file(filepath_);
            if (saved.is_error()) {
                return saved;
            }
        }

        change.previous = preferences_;
        preferences_ = next;
        change.current = std::move(next);
    }

    publish(change);
    return Result<void>();
}

Result<void> PreferencesStore::subscribe(const std::string& subscriber_id,
                                         PreferencesCallback callback) {
    if (subscriber_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                "PreferencesStore");
    }
    if (!callback) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Callback function cannot be null",
                                "PreferencesStore");
    }

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_[subscriber_id] = std::move(callback);
    DEBUG("Added preferences subscriber " << subscriber_id);
    return Result<void>();
}

Result<void> PreferencesStore::unsubscribe(const std::string& subscriber_id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    if (subscribers_.erase(subscriber_id) == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Subscriber ID not found: " + subscriber_id, "PreferencesStore");
    }
    return Result<void>();
}

size_t PreferencesStore::subscriber_count() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.size();
}

void PreferencesStore::publish(const PreferencesChange& change) const {
    std::vector<std::pair<std::string, PreferencesCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        targets.assign(subscribers_.begin(), subscribers_.end());
    }

    for (const auto& [id, callback] : targets) {
        try {
            callback(change);
        } catch (const std::exception& e) {
            ERROR("Error in preferences subscriber " << id << ": " << e.what());
        }
    }
}

}  // namespace trade_journal
