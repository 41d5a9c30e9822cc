// tests/core/test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "trade_journal/core/config_base.hpp"

using namespace trade_journal;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "journal_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

class SampleConfig : public ConfigBase {
public:
    std::string name = "default";
    int bins = 20;
    double percent = 10.0;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["bins"] = bins;
        j["percent"] = percent;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("bins"))
            bins = j["bins"].get<int>();
        if (j.contains("percent"))
            percent = j["percent"].get<double>();
        if (bins < 1)
            throw JournalError(ErrorCode::INVALID_ARGUMENT, "bins must be positive", "Sample");
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    SampleConfig config;
    config.name = "test";
    config.bins = 12;
    config.percent = 15.0;

    std::filesystem::path file_path = test_dir / "sample.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok()) << save_result.error()->what();
    ASSERT_TRUE(std::filesystem::exists(file_path));

    SampleConfig loaded;
    auto load_result = loaded.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->what();

    EXPECT_EQ(loaded.name, "test");
    EXPECT_EQ(loaded.bins, 12);
    EXPECT_DOUBLE_EQ(loaded.percent, 15.0);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    SampleConfig config;
    nlohmann::json partial;
    partial["name"] = "partial";

    config.from_json(partial);

    EXPECT_EQ(config.name, "partial");
    EXPECT_EQ(config.bins, 20);
    EXPECT_DOUBLE_EQ(config.percent, 10.0);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    SampleConfig config;

    std::filesystem::path file_path = test_dir / "invalid.json";
    std::ofstream file(file_path);
    file << "{ this is not valid JSON }";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, MissingFileReported) {
    SampleConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, LoadFromStringPropagatesFieldErrors) {
    SampleConfig config;
    ASSERT_TRUE(config.load_from_string(R"({"name": "inline", "bins": 8})").is_ok());
    EXPECT_EQ(config.name, "inline");
    EXPECT_EQ(config.bins, 8);

    auto rejected = config.load_from_string(R"({"bins": 0})");
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto malformed = config.load_from_string("{");
    ASSERT_TRUE(malformed.is_error());
    EXPECT_EQ(malformed.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}
