#include <gtest/gtest.h>

#include <numbers>
#include <set>
#include <stdexcept>

#include "realm/store/region_store.hpp"

using namespace reaches::realm;
using namespace reaches::realm::store;

class RegionStoreTest : public ::testing::Test {
protected:
    model::Timestamp clockValue = 1000;
    RegionStore store{StoreOptions{EngineConfig{},
                                   [this] { return clockValue; },
                                   std::nullopt}};

    auto createForest() -> model::Region {
        auto created = store.create(
            {"Forest", geometry::Polygon{{0, 0, 50, 0, 50, 50, 0, 50}},
             {"biome:forest"}});
        EXPECT_TRUE(created.has_value());
        return *created;
    }

    auto createDesert() -> model::Region {
        auto created = store.create(
            {"Desert", geometry::Circle{75, 75, 25}, {"biome:desert"}});
        EXPECT_TRUE(created.has_value());
        return *created;
    }
};

TEST_F(RegionStoreTest, SpatialQueryScenario) {
    auto forest = createForest();
    auto desert = createDesert();

    auto atForest = store.queryPoint(25, 25);
    ASSERT_EQ(atForest.size(), 1u);
    EXPECT_EQ(atForest[0].id(), forest.id());

    EXPECT_TRUE(store.queryPoint(250, 250).empty());

    std::vector<std::string> wanted = {"biome:desert"};
    auto deserts = store.queryTags(wanted);
    ASSERT_EQ(deserts.size(), 1u);
    EXPECT_EQ(deserts[0].id(), desert.id());
}

TEST_F(RegionStoreTest, BoundingBoxCornerIsNotContainment) {
    createDesert();
    // Inside the circle's bounding box but outside the circle
    EXPECT_TRUE(store.queryPoint(52, 52).empty());
    EXPECT_FALSE(store.regionAt(52, 52).has_value());
    EXPECT_TRUE(store.regionAt(75, 75).has_value());
}

TEST_F(RegionStoreTest, RotatedRectangleFoundOutsideUnrotatedBounds) {
    auto created = store.create({"Tower",
                                 geometry::Rectangle{0, 0, 100, 10,
                                                     std::numbers::pi / 2.0},
                                 {"terrain:rugged"}});
    ASSERT_TRUE(created.has_value());
    ASSERT_TRUE(created->containsPoint(0, 40));

    auto hits = store.queryPoint(0, 40);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id(), created->id());
    EXPECT_TRUE(store.regionAt(0, 40).has_value());

    model::RegionQuery atPoint;
    atPoint.point = std::make_pair(0.0, 40.0);
    EXPECT_EQ(store.find(atPoint).size(), 1u);

    // Inside the unrotated bounds but outside the turned shape
    EXPECT_TRUE(store.queryPoint(40, 0).empty());

    // Box queries keep using the unrotated bounds
    EXPECT_EQ(store.queryBounds({40, -1, 2, 2}).size(), 1u);
}

TEST_F(RegionStoreTest, CreateAssignsFreshIdAndMetadata) {
    clockValue = 5000;
    auto region = createForest();

    EXPECT_EQ(region.id().size(), 16u);
    EXPECT_EQ(region.metadata().created, 5000);
    EXPECT_EQ(region.metadata().modified, 5000);
    EXPECT_EQ(region.metadata().author, "Unknown");
    EXPECT_EQ(region.metadata().version, "1.0.0");
    EXPECT_TRUE(store.contains(region.id()));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(RegionStoreTest, CreateWithAuthorAndDefaultName) {
    auto created = store.create(
        {"", geometry::Circle{0, 0, 5}, {}, std::string("Cartographer")});
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->metadata().author, "Cartographer");
    EXPECT_EQ(created->name(), "Realm " + created->id().substr(0, 8));
}

TEST_F(RegionStoreTest, CreateRejectsInvalidTag) {
    auto created = store.create(
        {"Bad", geometry::Circle{0, 0, 5}, {"biome:forest", "forest"}});
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, RealmErrorCode::InvalidTag);
    EXPECT_EQ(created.error().subject, "forest");
    EXPECT_TRUE(store.empty());
}

TEST_F(RegionStoreTest, CreateAppliesSingleValuedReplacement) {
    auto created = store.create({"Swampy", geometry::Circle{0, 0, 5},
                                 {"biome:forest", "biome:swamp",
                                  "resources:herbs", "resources:fish"}});
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->tags(),
              (std::vector<std::string>{"biome:swamp", "resources:fish",
                                        "resources:herbs"}));
}

TEST_F(RegionStoreTest, DefaultTagsAppliedFirst) {
    RegionStore withDefaults(
        StoreOptions{EngineConfig::withAnnotatorDefaults(),
                     [this] { return clockValue; }, std::nullopt});

    auto plain = withDefaults.create({"Plain", geometry::Circle{0, 0, 1}, {}});
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->tags(), (std::vector<std::string>{"biome:unknown"}));

    auto forest = withDefaults.create(
        {"Forest", geometry::Circle{0, 0, 1}, {"biome:forest"}});
    ASSERT_TRUE(forest.has_value());
    EXPECT_EQ(forest->tags(), (std::vector<std::string>{"biome:forest"}));
}

TEST_F(RegionStoreTest, InvalidConfigurationThrows) {
    EngineConfig badLength;
    badLength.idLength = 2;
    EXPECT_THROW(RegionStore(StoreOptions{badLength, {}, std::nullopt}),
                 std::invalid_argument);

    EngineConfig badTag;
    badTag.defaultTags = {"unknown"};
    EXPECT_THROW(RegionStore(StoreOptions{badTag, {}, std::nullopt}),
                 std::invalid_argument);
}

TEST_F(RegionStoreTest, EmptyPatchOnlyTouchesModified) {
    auto original = createForest();
    clockValue = 2000;

    auto updated = store.update(original.id(), {});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->metadata().modified, 2000);
    EXPECT_EQ(updated->metadata().created, original.metadata().created);
    EXPECT_EQ(updated->name(), original.name());
    EXPECT_EQ(updated->geometry(), original.geometry());
    EXPECT_EQ(updated->rawTags(), original.rawTags());

    // Repeating the same patch keeps the content identical
    clockValue = 3000;
    model::RegionPatch same;
    same.name = original.name();
    same.addTags = {"biome:forest"};
    auto again = store.update(original.id(), same);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->metadata().modified, 3000);
    EXPECT_EQ(again->rawTags(), original.rawTags());
    EXPECT_EQ(again->name(), original.name());
}

TEST_F(RegionStoreTest, PatchAppliesInOrder) {
    auto region = createForest();

    model::RegionPatch patch;
    patch.name = "Burnt Forest";
    patch.geometry = geometry::Circle{10, 10, 5};
    patch.tags = std::vector<std::string>{"biome:forest", "terrain:dense",
                                          "resources:timber"};
    patch.removeTags = {"resources:timber", "custom:absent"};
    patch.addTags = {"biome:desert", "terrain:broken"};

    auto updated = store.update(region.id(), patch);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->name(), "Burnt Forest");
    EXPECT_EQ(updated->tags(),
              (std::vector<std::string>{"biome:desert", "terrain:broken",
                                        "terrain:dense"}));

    // Bounds cache follows the geometry
    EXPECT_TRUE(store.queryPoint(25, 25).empty());
    EXPECT_EQ(store.queryPoint(10, 10).size(), 1u);
}

TEST_F(RegionStoreTest, UpdateFailuresLeaveRegionUntouched) {
    auto region = createForest();

    model::RegionPatch bad;
    bad.name = "Renamed";
    bad.addTags = {"travel_speed:9"};
    auto result = store.update(region.id(), bad);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RealmErrorCode::InvalidTag);
    EXPECT_EQ(store.get(region.id()), region);

    auto missing = store.update("nope", {});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, RealmErrorCode::NotFound);
}

TEST_F(RegionStoreTest, RemoveAndLookups) {
    auto region = createForest();
    EXPECT_TRUE(store.remove(region.id()));
    EXPECT_FALSE(store.remove(region.id()));
    EXPECT_FALSE(store.get(region.id()).has_value());
    EXPECT_TRUE(store.queryPoint(25, 25).empty());
}

TEST_F(RegionStoreTest, DeletedIdsAreNotReissued) {
    std::set<std::string> issued;
    for (int i = 0; i < 50; ++i) {
        auto region = createForest();
        EXPECT_TRUE(issued.insert(region.id()).second);
        store.remove(region.id());
    }
    EXPECT_TRUE(store.empty());
}

TEST_F(RegionStoreTest, QueriesPreserveInsertionOrder) {
    auto first = createForest();
    auto second = createDesert();
    auto third = store.create(
        {"Overlap", geometry::Rectangle{40, 40, 40, 40, 0}, {"biome:forest"}});
    ASSERT_TRUE(third.has_value());

    auto all = store.all();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id(), first.id());
    EXPECT_EQ(all[1].id(), second.id());
    EXPECT_EQ(all[2].id(), third->id());

    auto forests = store.findByTag("biome:forest");
    ASSERT_EQ(forests.size(), 2u);
    EXPECT_EQ(forests[0].id(), first.id());
    EXPECT_EQ(forests[1].id(), third->id());

    EXPECT_EQ(store.findByTagKey("biome").size(), 3u);
    EXPECT_EQ(store.queryTags({}).size(), 3u);
}

TEST_F(RegionStoreTest, BoundsQuery) {
    createForest();
    auto desert = createDesert();

    auto hits = store.queryBounds({90, 90, 100, 100});
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id(), desert.id());

    // Touching edges count as intersecting
    EXPECT_EQ(store.queryBounds({50, 50, 0, 0}).size(), 2u);
}

TEST_F(RegionStoreTest, CombinedFind) {
    createForest();
    auto desert = createDesert();
    ASSERT_TRUE(store
                    .create({"Grove", geometry::Circle{300, 300, 10},
                             {"biome:forest", "resources:timber"}})
                    .has_value());

    model::RegionQuery query;
    query.tags = std::vector<std::string>{"biome:forest"};
    query.bounds = geometry::BoundingBox{250, 250, 100, 100};
    auto grove = store.find(query);
    ASSERT_EQ(grove.size(), 1u);
    EXPECT_EQ(grove[0].name(), "Grove");

    model::RegionQuery limited;
    limited.limit = 2;
    EXPECT_EQ(store.find(limited).size(), 2u);
    EXPECT_EQ(store.find(model::RegionQuery{}).size(), 3u);

    model::RegionQuery atPoint;
    atPoint.point = std::make_pair(75.0, 75.0);
    auto here = store.find(atPoint);
    ASSERT_EQ(here.size(), 1u);
    EXPECT_EQ(here[0].id(), desert.id());
}

TEST_F(RegionStoreTest, InsertVerbatim) {
    model::Region region("Verbatim00000001", "Kept",
                         geometry::Circle{0, 0, 10},
                         model::RegionMetadata{1, 2, "Elsewhere", "1.0.0"});
    std::vector<std::string> tags = {"biome:forest", "biome:swamp"};
    ASSERT_TRUE(region.restoreTags(tags).has_value());

    ASSERT_TRUE(store.insert(region).has_value());
    EXPECT_EQ(store.get("Verbatim00000001"), region);

    auto duplicate = store.insert(region);
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, RealmErrorCode::DuplicateId);
}

TEST_F(RegionStoreTest, Statistics) {
    createForest();
    auto created = store.create({"Wood", geometry::Circle{0, 0, 1},
                                 {"biome:forest", "resources:timber",
                                  "resources:game"}});
    ASSERT_TRUE(created.has_value());

    auto stats = store.statistics();
    EXPECT_EQ(stats.totalRegions, 2u);
    EXPECT_EQ(stats.scope, "global");
    EXPECT_EQ(stats.tagCounts["biome"], 2u);
    EXPECT_EQ(stats.tagCounts["resources"], 2u);
    EXPECT_EQ(stats.toJson()["totalRealms"], 2);
}

TEST_F(RegionStoreTest, ListenersReceiveEvents) {
    std::vector<StoreEvent> events;
    auto listener = store.addListener(
        [&events](const StoreEvent& e) { events.push_back(e); });

    auto region = createForest();
    ASSERT_TRUE(store.update(region.id(), {}).has_value());
    store.remove(region.id());
    createDesert();
    store.clear();

    ASSERT_EQ(events.size(), 5u);
    EXPECT_EQ(events[0].type, StoreEventType::Created);
    EXPECT_EQ(events[0].regionId, region.id());
    EXPECT_EQ(events[1].type, StoreEventType::Updated);
    EXPECT_EQ(events[2].type, StoreEventType::Deleted);
    EXPECT_EQ(events[4].type, StoreEventType::Cleared);
    EXPECT_EQ(events[4].count, 1u);
    EXPECT_EQ(events[4].scope, "global");

    EXPECT_TRUE(store.removeListener(listener));
    EXPECT_FALSE(store.removeListener(listener));
    createForest();
    EXPECT_EQ(events.size(), 5u);
}

TEST_F(RegionStoreTest, ThrowingListenerDoesNotBreakStore) {
    int calls = 0;
    store.addListener(
        [](const StoreEvent&) { throw std::runtime_error("listener boom"); });
    store.addListener([&calls](const StoreEvent&) { ++calls; });

    auto region = createForest();
    EXPECT_TRUE(store.contains(region.id()));
    EXPECT_EQ(calls, 1);
}

TEST_F(RegionStoreTest, NotifyImportedReportsCount) {
    std::vector<StoreEvent> events;
    store.addListener(
        [&events](const StoreEvent& e) { events.push_back(e); });

    store.notifyImported(3);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, StoreEventType::Imported);
    EXPECT_EQ(events[0].count, 3u);
    EXPECT_EQ(events[0].scope, "global");
    EXPECT_TRUE(events[0].regionId.empty());
}
