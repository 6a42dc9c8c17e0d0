#include "runtime/EngineConfig.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace ACE;

TEST(EngineConfigTest, DefaultsWhenKeysMissing) {
    auto config = EngineConfig::fromJson(Value::object());

    EXPECT_EQ("", config.name);
    EXPECT_EQ(0u, config.maxHistory);
    EXPECT_FALSE(config.resetAtRoot);
    EXPECT_FALSE(config.debug);
}

TEST(EngineConfigTest, ReadsAllKeys) {
    auto config = EngineConfig::fromJson(
        Value{{"name", "lexer"}, {"maxHistory", 16}, {"resetAtRoot", true}, {"debug", true}});

    EXPECT_EQ("lexer", config.name);
    EXPECT_EQ(16u, config.maxHistory);
    EXPECT_TRUE(config.resetAtRoot);
    EXPECT_TRUE(config.debug);
}

TEST(EngineConfigTest, RejectsNonObject) {
    EXPECT_THROW(EngineConfig::fromJson(Value::array()), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson(Value("lexer")), std::invalid_argument);
}

TEST(EngineConfigTest, RejectsInvalidMaxHistory) {
    EXPECT_THROW(EngineConfig::fromJson(Value{{"maxHistory", -1}}), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson(Value{{"maxHistory", 2.5}}), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson(Value{{"maxHistory", "10"}}), std::invalid_argument);
}

TEST(EngineConfigTest, RejectsWronglyTypedFlags) {
    EXPECT_THROW(EngineConfig::fromJson(Value{{"name", 7}}), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson(Value{{"resetAtRoot", "yes"}}), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson(Value{{"debug", 1}}), std::invalid_argument);
}

TEST(EngineConfigTest, NullValuesKeepDefaults) {
    auto config = EngineConfig::fromJson(Value{{"maxHistory", nullptr}, {"resetAtRoot", nullptr}});

    EXPECT_EQ(0u, config.maxHistory);
    EXPECT_FALSE(config.resetAtRoot);
}
