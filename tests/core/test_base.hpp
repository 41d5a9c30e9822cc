// tests/core/test_base.hpp
#pragma once

#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include "trade_journal/core/config_version.hpp"
#include "trade_journal/core/logger.hpp"

namespace trade_journal {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigVersionManager::reset_instance();
        Logger::reset_for_tests();

        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        ASSERT_TRUE(Logger::instance().initialize(config).is_ok());
    }

    void TearDown() override {
        Logger::reset_for_tests();
        ConfigVersionManager::reset_instance();
    }
};

}  // namespace testing
}  // namespace trade_journal
