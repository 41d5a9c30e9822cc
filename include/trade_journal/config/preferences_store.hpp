// include/trade_journal/config/preferences_store.hpp
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_journal/config/dashboard_preferences.hpp"
#include "trade_journal/core/error.hpp"

namespace trade_journal {

/**
 * @brief Notification sent to subscribers after preferences change
 */
struct PreferencesChange {
    DashboardPreferences previous;
    DashboardPreferences current;
    std::vector<std::string> changed_fields;
};

using PreferencesCallback = std::function<void(const PreferencesChange&)>;

/**
 * @brief Owner of the persisted dashboard preferences
 *
 * Loads and migrates the preferences document, applies updates atomically
 * and publishes every effective change to subscribers. Callbacks run on the
 * updating thread after the store's lock is released, so a callback may
 * read the store.
 */
class PreferencesStore {
public:
    /**
     * @param filepath JSON file backing the store; empty keeps preferences in memory only
     */
    explicit PreferencesStore(std::string filepath = "");

    /**
     * @brief Load preferences from disk, migrating older documents
     *
     * A missing file yields the defaults. A migrated document is written
     * back at the current version.
     */
    Result<void> load();

    /**
     * @brief Snapshot of the current preferences
     */
    DashboardPreferences get() const;

    /**
     * @brief Apply a modification, persist it and notify subscribers
     * @param mutator Edits a copy of the current preferences
     * @return Error if the edited preferences are invalid or cannot be saved
     */
    Result<void> update(const std::function<void(DashboardPreferences&)>& mutator);

    /**
     * @brief Replace all preferences at once
     */
    Result<void> replace(const DashboardPreferences& preferences);

    /**
     * @brief Register a change callback under a unique id
     */
    Result<void> subscribe(const std::string& subscriber_id, PreferencesCallback callback);

    Result<void> unsubscribe(const std::string& subscriber_id);

    size_t subscriber_count() const;

private:
    Result<void> commit(DashboardPreferences next);
    void publish(const PreferencesChange& change) const;

    std::string filepath_;
    DashboardPreferences preferences_;
    std::unordered_map<std::string, PreferencesCallback> subscribers_;
    mutable std::mutex mutex_;
    mutable std::mutex subscribers_mutex_;
};

}  // namespace trade_journal
