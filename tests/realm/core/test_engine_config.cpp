#include <gtest/gtest.h>

#include "realm/core/engine_config.hpp"
#include "realm/core/error.hpp"
#include "realm/core/logging.hpp"

using namespace reaches::realm;

class EngineConfigTest : public ::testing::Test {};

TEST_F(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_TRUE(config.isValid());
    EXPECT_EQ(config.scope, "global");
    EXPECT_EQ(config.defaultAuthor, "Unknown");
    EXPECT_TRUE(config.defaultTags.empty());
    EXPECT_EQ(config.idLength, 16u);
    EXPECT_EQ(config.maxSuggestions, 10u);
}

TEST_F(EngineConfigTest, AnnotatorDefaultsTagUnknownBiome) {
    auto config = EngineConfig::withAnnotatorDefaults();
    ASSERT_EQ(config.defaultTags.size(), 1u);
    EXPECT_EQ(config.defaultTags[0], "biome:unknown");
    EXPECT_DOUBLE_EQ(config.planeWidth.value_or(0.0), 4000.0);
    EXPECT_TRUE(config.isValid());
}

TEST_F(EngineConfigTest, RejectsOutOfRangeIdLength) {
    EngineConfig config;
    config.idLength = 4;
    EXPECT_FALSE(config.isValid());
    config.idLength = 65;
    EXPECT_FALSE(config.isValid());
    config.idLength = 8;
    EXPECT_TRUE(config.isValid());
}

TEST_F(EngineConfigTest, RejectsZeroSuggestionsAndEmptyScope) {
    EngineConfig config;
    config.maxSuggestions = 0;
    EXPECT_FALSE(config.validate().empty());

    config = EngineConfig{};
    config.scope.clear();
    EXPECT_FALSE(config.validate().empty());
}

TEST_F(EngineConfigTest, JsonRoundTrip) {
    EngineConfig config;
    config.scope = "scene-42";
    config.defaultAuthor = "GM";
    config.defaultTags = {"biome:unknown", "custom:draft"};
    config.idLength = 20;
    config.planeWidth = 1200.0;
    config.planeHeight = 800.0;

    auto restored = EngineConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.scope, "scene-42");
    EXPECT_EQ(restored.defaultAuthor, "GM");
    EXPECT_EQ(restored.defaultTags, config.defaultTags);
    EXPECT_EQ(restored.idLength, 20u);
    ASSERT_TRUE(restored.planeWidth.has_value());
    EXPECT_DOUBLE_EQ(*restored.planeWidth, 1200.0);
    EXPECT_DOUBLE_EQ(*restored.planeHeight, 800.0);
}

TEST_F(EngineConfigTest, ParseKeepsDefaultsForMissingKeys) {
    auto config = parseEngineConfig(R"({"scope": "scene-1"})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->scope, "scene-1");
    EXPECT_EQ(config->idLength, 16u);
}

TEST_F(EngineConfigTest, ParseRejectsBadInput) {
    EXPECT_FALSE(parseEngineConfig("{not json").has_value());
    EXPECT_FALSE(parseEngineConfig("[1, 2]").has_value());
    EXPECT_FALSE(parseEngineConfig(R"({"idLength": 2})").has_value());
    EXPECT_FALSE(parseEngineConfig(R"({"idLength": "long"})").has_value());
}

TEST_F(EngineConfigTest, LoggingLevelNames) {
    EXPECT_EQ(levelFromString("debug"), spdlog::level::debug);
    EXPECT_EQ(levelFromString("warn"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("bogus"), spdlog::level::info);

    LoggingConfig logging;
    logging.level = spdlog::level::debug;
    logging.color = false;
    auto restored = LoggingConfig::fromJson(logging.toJson());
    EXPECT_EQ(restored.level, spdlog::level::debug);
    EXPECT_FALSE(restored.color);
}

TEST_F(EngineConfigTest, ErrorToString) {
    RealmError error(RealmErrorCode::NotFound, "Region not found", "abc");
    EXPECT_EQ(error.toString(), "NotFound: Region not found (abc)");
    EXPECT_EQ(realmErrorCodeToString(RealmErrorCode::UnsupportedFormat),
              "UnsupportedFormat");
}
