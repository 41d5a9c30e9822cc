// tests/config/test_preferences_store.cpp
#include "trade_journal/config/preferences_store.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "core/test_base.hpp"

using namespace trade_journal;

class PreferencesStoreTest : public trade_journal::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "trade_journal_preferences_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
        prefs_path = (test_dir / "preferences.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
        TestBase::TearDown();
    }

    void write_prefs(const nlohmann::json& document) {
        std::ofstream file(prefs_path);
        file << document.dump(2);
    }

    nlohmann::json read_prefs() {
        std::ifstream file(prefs_path);
        nlohmann::json document;
        file >> document;
        return document;
    }

    std::filesystem::path test_dir;
    std::string prefs_path;
};

TEST_F(PreferencesStoreTest, MissingFileUsesDefaults) {
    PreferencesStore store(prefs_path);
    ASSERT_TRUE(store.load().is_ok());

    auto prefs = store.get();
    EXPECT_EQ(prefs.section_order.size(), 7u);
    EXPECT_EQ(prefs.section_order.front(), "summary");
    EXPECT_TRUE(prefs.is_visible("win_rate"));
    EXPECT_EQ(prefs.color_thresholds.at("tilt_score"), (ColorThreshold{3.0, 7.0}));
    EXPECT_FALSE(std::filesystem::exists(prefs_path));
}

TEST_F(PreferencesStoreTest, MigratesFirstVersionDocument) {
    write_prefs({{"version", "1.0.0"},
                 {"hidden_metrics", nlohmann::json::array({"sharpe_ratio"})},
                 {"section_order", "summary, tilt"},
                 {"win_rate_good", 0.6},
                 {"win_rate_bad", 0.4}});

    PreferencesStore store(prefs_path);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error()->what();

    auto prefs = store.get();
    EXPECT_FALSE(prefs.is_visible("sharpe_ratio"));
    EXPECT_TRUE(prefs.is_visible("win_rate"));
    EXPECT_EQ(prefs.section_order, (std::vector<std::string>{"summary", "tilt"}));
    ASSERT_EQ(prefs.color_thresholds.count("win_rate"), 1u);
    EXPECT_EQ(prefs.color_thresholds.at("win_rate"), (ColorThreshold{0.6, 0.4}));

    auto saved = read_prefs();
    EXPECT_EQ(saved["version"], "2.0.0");
    EXPECT_TRUE(saved["section_order"].is_array());
    EXPECT_FALSE(saved.contains("hidden_metrics"));
    EXPECT_FALSE(saved.contains("win_rate_good"));
}

TEST_F(PreferencesStoreTest, RejectsBrokenFiles) {
    {
        std::ofstream file(prefs_path);
        file << "{ broken";
    }
    PreferencesStore malformed(prefs_path);
    auto result = malformed.load();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    write_prefs({{"version", "2.0.0"}, {"section_order", nlohmann::json::array({"tilt", "tilt"})}});
    PreferencesStore duplicated(prefs_path);
    auto duplicate = duplicated.load();
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PreferencesStoreTest, UpdateNotifiesSubscribers) {
    PreferencesStore store(prefs_path);
    ASSERT_TRUE(store.load().is_ok());

    std::vector<PreferencesChange> changes;
    ASSERT_TRUE(store
                    .subscribe("dashboard",
                               [&changes](const PreferencesChange& change) {
                                   changes.push_back(change);
                               })
                    .is_ok());
    EXPECT_EQ(store.subscriber_count(), 1u);

    ASSERT_TRUE(store
                    .update([](DashboardPreferences& prefs) {
                        prefs.section_order = {"tilt", "summary"};
                    })
                    .is_ok());

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].changed_fields, (std::vector<std::string>{"section_order"}));
    EXPECT_EQ(changes[0].previous.section_order.size(), 7u);
    EXPECT_EQ(changes[0].current.section_order, (std::vector<std::string>{"tilt", "summary"}));
    EXPECT_EQ(store.get().section_order, changes[0].current.section_order);
}

TEST_F(PreferencesStoreTest, NoOpUpdateIsSilent) {
    PreferencesStore store;
    ASSERT_TRUE(store.load().is_ok());

    int calls = 0;
    ASSERT_TRUE(store.subscribe("counter", [&calls](const PreferencesChange&) { ++calls; }).is_ok());
    ASSERT_TRUE(store.update([](DashboardPreferences&) {}).is_ok());
    ASSERT_TRUE(store.replace(store.get()).is_ok());
    EXPECT_EQ(calls, 0);
}

TEST_F(PreferencesStoreTest, InvalidUpdateLeavesPreferencesUnchanged) {
    PreferencesStore store;
    ASSERT_TRUE(store.load().is_ok());

    int calls = 0;
    ASSERT_TRUE(store.subscribe("counter", [&calls](const PreferencesChange&) { ++calls; }).is_ok());

    auto result = store.update([](DashboardPreferences& prefs) {
        prefs.section_order.push_back("summary");
    });
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(store.get().section_order.size(), 7u);
    EXPECT_EQ(calls, 0);

    EXPECT_TRUE(store.update(nullptr).is_error());
}

TEST_F(PreferencesStoreTest, UpdatesArePersisted) {
    {
        PreferencesStore store(prefs_path);
        ASSERT_TRUE(store.load().is_ok());
        ASSERT_TRUE(store
                        .update([](DashboardPreferences& prefs) {
                            prefs.metric_visibility["expectancy"] = false;
                        })
                        .is_ok());
    }

    PreferencesStore reopened(prefs_path);
    ASSERT_TRUE(reopened.load().is_ok());
    EXPECT_FALSE(reopened.get().is_visible("expectancy"));
    EXPECT_EQ(read_prefs()["version"], DashboardPreferences::CURRENT_VERSION);
}

TEST_F(PreferencesStoreTest, SubscriptionManagement) {
    PreferencesStore store;
    EXPECT_TRUE(store.subscribe("", [](const PreferencesChange&) {}).is_error());
    EXPECT_TRUE(store.subscribe("null", nullptr).is_error());

    ASSERT_TRUE(store.subscribe("a", [](const PreferencesChange&) {}).is_ok());
    ASSERT_TRUE(store.subscribe("b", [](const PreferencesChange&) {}).is_ok());
    EXPECT_EQ(store.subscriber_count(), 2u);

    EXPECT_TRUE(store.unsubscribe("a").is_ok());
    EXPECT_TRUE(store.unsubscribe("a").is_error());
    EXPECT_EQ(store.subscriber_count(), 1u);
}

TEST_F(PreferencesStoreTest, CallbacksMayReadTheStoreAndFailuresAreIsolated) {
    PreferencesStore store;
    ASSERT_TRUE(store.load().is_ok());

    bool saw_new_value = false;
    ASSERT_TRUE(store
                    .subscribe("thrower",
                               [](const PreferencesChange&) {
                                   throw std::runtime_error("subscriber failure");
                               })
                    .is_ok());
    ASSERT_TRUE(store
                    .subscribe("reader",
                               [&store, &saw_new_value](const PreferencesChange&) {
                                   saw_new_value = !store.get().is_visible("tilt_score");
                               })
                    .is_ok());

    ASSERT_TRUE(store
                    .update([](DashboardPreferences& prefs) {
                        prefs.metric_visibility["tilt_score"] = false;
                    })
                    .is_ok());
    EXPECT_TRUE(saw_new_value);
}

TEST_F(PreferencesStoreTest, DiffNamesChangedFields) {
    auto base = DashboardPreferences::defaults();
    auto changed = base;
    changed.color_thresholds["win_rate"].good = 0.6;
    changed.metric_visibility["win_rate"] = false;

    EXPECT_TRUE(base.diff(base).empty());
    EXPECT_EQ(base.diff(changed),
              (std::vector<std::string>{"metric_visibility", "color_thresholds"}));
}
