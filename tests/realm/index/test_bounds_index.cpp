#include <gtest/gtest.h>

#include "realm/index/bounds_index.hpp"

using namespace reaches::realm;
using reaches::realm::index::BoundsIndex;

class BoundsIndexTest : public ::testing::Test {
protected:
    BoundsIndex boxes;

    void SetUp() override {
        boxes.insert("square", {0, 0, 50, 50});
        boxes.insert("circle", {50, 50, 50, 50});
        boxes.insert("far", {1000, 1000, 10, 10});
    }
};

TEST_F(BoundsIndexTest, KeepsInsertionOrder) {
    EXPECT_EQ(boxes.size(), 3u);
    EXPECT_EQ(boxes.ids(),
              (std::vector<std::string>{"square", "circle", "far"}));
}

TEST_F(BoundsIndexTest, PointCandidatesAreInclusive) {
    EXPECT_EQ(boxes.candidatesAt(25, 25),
              (std::vector<std::string>{"square"}));
    EXPECT_EQ(boxes.candidatesAt(50, 50),
              (std::vector<std::string>{"square", "circle"}));
    EXPECT_TRUE(boxes.candidatesAt(250, 250).empty());
}

TEST_F(BoundsIndexTest, BoxSearchWithLimit) {
    geometry::BoundingBox everything{-10, -10, 2000, 2000};
    EXPECT_EQ(boxes.searchBox(everything).size(), 3u);
    EXPECT_EQ(boxes.searchBox(everything, 2),
              (std::vector<std::string>{"square", "circle"}));
    EXPECT_EQ(boxes.searchBox({990, 990, 5, 5}),
              (std::vector<std::string>{}));
}

TEST_F(BoundsIndexTest, ReinsertRefreshesBoxInPlace) {
    boxes.insert("square", {500, 500, 10, 10});
    EXPECT_EQ(boxes.size(), 3u);
    EXPECT_EQ(boxes.ids().front(), "square");
    EXPECT_TRUE(boxes.candidatesAt(25, 25).empty());
    EXPECT_EQ(boxes.boundsOf("square"),
              (geometry::BoundingBox{500, 500, 10, 10}));
}

TEST_F(BoundsIndexTest, RemoveKeepsRemainingOrder) {
    EXPECT_TRUE(boxes.remove("square"));
    EXPECT_FALSE(boxes.remove("square"));
    EXPECT_FALSE(boxes.contains("square"));
    EXPECT_FALSE(boxes.boundsOf("square").has_value());
    EXPECT_EQ(boxes.ids(), (std::vector<std::string>{"circle", "far"}));
    EXPECT_EQ(boxes.candidatesAt(1005, 1005),
              (std::vector<std::string>{"far"}));
}

TEST_F(BoundsIndexTest, PointCandidatesUseReach) {
    // Lying 100x10 box whose drawn shape stands upright
    boxes.insert("tower", {-50, -5, 100, 10}, {-5, -50, 10, 100});

    EXPECT_EQ(boxes.candidatesAt(0, 40),
              (std::vector<std::string>{"tower"}));
    EXPECT_TRUE(boxes.candidatesAt(40, 0).empty());
    EXPECT_EQ(boxes.searchBox({30, -2, 5, 4}),
              (std::vector<std::string>{"tower"}));
    EXPECT_EQ(boxes.boundsOf("tower"),
              (geometry::BoundingBox{-50, -5, 100, 10}));
    EXPECT_EQ(boxes.reachOf("tower"),
              (geometry::BoundingBox{-5, -50, 10, 100}));
    EXPECT_EQ(boxes.reachOf("square"), boxes.boundsOf("square"));
}

TEST_F(BoundsIndexTest, Clear) {
    boxes.clear();
    EXPECT_TRUE(boxes.empty());
    EXPECT_TRUE(boxes.candidatesAt(25, 25).empty());
}
