#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "realm/realm.hpp"

using namespace reaches::realm;
using reaches::realm::service::RealmEngine;

class RealmEngineTest : public ::testing::Test {
protected:
    model::Timestamp clockValue = 1000;
    RealmEngine engine{EngineConfig{}, [this] { return clockValue; }};
};

TEST_F(RealmEngineTest, TagOperations) {
    EXPECT_TRUE(engine.validateTag("biome:forest"));
    EXPECT_FALSE(engine.validateTag("forest"));

    auto checked = engine.checkTag("travel_speed:3");
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().reason, tag::TagErrorReason::SemanticRule);

    std::vector<std::string> existing;
    auto suggestions = engine.suggestTags("swamp", existing);
    ASSERT_FALSE(suggestions.empty());
    EXPECT_EQ(suggestions[0].tag, "biome:swamp");

    std::vector<std::string> clash = {"biome:forest", "biome:swamp"};
    EXPECT_EQ(engine.detectConflicts(clash).size(), 1u);

    auto preset = engine.biomePreset("desert");
    ASSERT_FALSE(preset.empty());
    for (const auto& presetTag : preset) {
        EXPECT_TRUE(engine.validateTag(presetTag)) << presetTag;
    }
}

TEST_F(RealmEngineTest, RegionLifecycle) {
    auto created = engine.createRegion(
        "Forest", geometry::Polygon{{0, 0, 50, 0, 50, 50, 0, 50}},
        {"biome:forest"}, "Mapper");
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->metadata().author, "Mapper");
    EXPECT_EQ(engine.regions().size(), 1u);

    clockValue = 2000;
    model::RegionPatch patch;
    patch.addTags = {"resources:timber"};
    auto updated = engine.updateRegion(created->id(), patch);
    ASSERT_TRUE(updated.has_value());
    EXPECT_TRUE(updated->hasTag("resources:timber"));
    EXPECT_EQ(updated->metadata().modified, 2000);

    EXPECT_EQ(engine.getRegion(created->id()), *updated);
    EXPECT_TRUE(engine.deleteRegion(created->id()));
    EXPECT_FALSE(engine.getRegion(created->id()).has_value());

    auto missing = engine.updateRegion(created->id(), {});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, RealmErrorCode::NotFound);
}

TEST_F(RealmEngineTest, Queries) {
    auto forest = engine.createRegion(
        "Forest", geometry::Polygon{{0, 0, 50, 0, 50, 50, 0, 50}},
        {"biome:forest"});
    auto desert = engine.createRegion("Desert", geometry::Circle{75, 75, 25},
                                      {"biome:desert"});
    ASSERT_TRUE(forest.has_value());
    ASSERT_TRUE(desert.has_value());

    auto hits = engine.queryPoint(25, 25);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id(), forest->id());
    EXPECT_TRUE(engine.queryPoint(250, 250).empty());

    std::vector<std::string> wanted = {"biome:desert"};
    auto deserts = engine.queryTags(wanted);
    ASSERT_EQ(deserts.size(), 1u);
    EXPECT_EQ(deserts[0].id(), desert->id());

    EXPECT_EQ(engine.queryBounds({60, 60, 10, 10}).size(), 1u);
    EXPECT_EQ(engine.findRegions(model::RegionQuery::withTags(
                                     {"biome:forest"}))
                  .size(),
              1u);
    ASSERT_TRUE(engine.regionAt(75, 75).has_value());
    EXPECT_EQ(engine.regionAt(75, 75)->id(), desert->id());

    auto stats = engine.statistics();
    EXPECT_EQ(stats.totalRegions, 2u);
    EXPECT_EQ(stats.tagCounts["biome"], 2u);
}

TEST_F(RealmEngineTest, ExportImportText) {
    ASSERT_TRUE(engine.createRegion("Dunes", geometry::Circle{75, 75, 25},
                                    {"biome:desert"})
                    .has_value());
    auto text = engine.exportText();

    RealmEngine other;
    auto imported = other.importText(text);
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(imported->importedCount, 1);
    EXPECT_EQ(other.regions(), engine.regions());

    auto again = other.importText(text, io::ImportPolicy::Merge);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(other.regions().size(), 2u);

    auto bad = other.importText("not json at all");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, RealmErrorCode::MalformedDocument);
    EXPECT_EQ(other.regions().size(), 2u);
}

TEST_F(RealmEngineTest, DocumentAndSceneImport) {
    ASSERT_TRUE(engine.createRegion("Dunes", geometry::Circle{75, 75, 25},
                                    {"biome:desert"})
                    .has_value());

    RealmEngine other;
    auto document = engine.exportStore();
    ASSERT_TRUE(other.importStore(document).has_value());
    ASSERT_TRUE(other.importStore(io::DocumentCodec::toJson(document),
                                  io::ImportPolicy::Replace)
                    .has_value());
    EXPECT_EQ(other.regions().size(), 1u);

    auto scene = engine.exportScene();
    auto result = other.importScene(scene);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(other.regions().size(), 2u);
}

TEST_F(RealmEngineTest, FromConfigText) {
    auto configured = RealmEngine::fromConfigText(
        R"({"scope": "cavern", "defaultTags": ["biome:mountain"],
            "logging": {"level": "warn"}})");
    ASSERT_TRUE(configured.has_value());
    EXPECT_EQ(configured->config().scope, "cavern");
    EXPECT_EQ(configured->regionStore().scope(), "cavern");

    auto region =
        configured->createRegion("Peak", geometry::Circle{0, 0, 10});
    ASSERT_TRUE(region.has_value());
    EXPECT_TRUE(region->hasTag("biome:mountain"));

    auto badTag = RealmEngine::fromConfigText(R"({"defaultTags": ["oops"]})");
    EXPECT_FALSE(badTag.has_value());

    auto badLength = RealmEngine::fromConfigText(R"({"idLength": 3})");
    EXPECT_FALSE(badLength.has_value());

    auto badJson = RealmEngine::fromConfigText("{");
    EXPECT_FALSE(badJson.has_value());
}

TEST_F(RealmEngineTest, RejectedConfigLeavesLoggingAlone) {
    auto before = spdlog::default_logger();

    auto rejected = RealmEngine::fromConfigText(
        R"({"defaultTags": ["oops"], "logging": {"logger": "rejected"}})");
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(spdlog::default_logger(), before);

    auto accepted = RealmEngine::fromConfigText(
        R"({"logging": {"logger": "accepted", "level": "warn"}})");
    ASSERT_TRUE(accepted.has_value());
    EXPECT_EQ(spdlog::default_logger()->name(), "accepted");
}

TEST_F(RealmEngineTest, MovedEngineKeepsRegions) {
    ASSERT_TRUE(engine.createRegion("Dunes", geometry::Circle{75, 75, 25})
                    .has_value());
    RealmEngine moved(std::move(engine));
    EXPECT_EQ(moved.regions().size(), 1u);
    EXPECT_EQ(moved.registry().maxSuggestions(), 10u);
}
