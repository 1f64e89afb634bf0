#include <gtest/gtest.h>

#include "realm/geometry/geometry_json.hpp"

using namespace reaches::realm::geometry;

class GeometryJsonTest : public ::testing::Test {};

TEST_F(GeometryJsonTest, WritesFieldLayout) {
    auto j = toJson(Rectangle{1, 2, 3, 4, 0.5});
    EXPECT_EQ(j["type"], "rectangle");
    EXPECT_DOUBLE_EQ(j["x"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(j["rotation"].get<double>(), 0.5);

    auto c = toJson(Circle{7, 8, 9});
    EXPECT_EQ(c["type"], "circle");
    EXPECT_DOUBLE_EQ(c["radius"].get<double>(), 9.0);

    auto p = toJson(Polygon{{0, 0, 1, 0, 1, 1}});
    EXPECT_EQ(p["type"], "polygon");
    EXPECT_EQ(p["points"].size(), 6u);
}

TEST_F(GeometryJsonTest, ReadsBackEveryShape) {
    std::vector<Geometry> shapes = {
        Polygon{{0.5, 0.25, 10, 0, 10, 10.125}},
        Rectangle{100, 50, 20, 10, 0.3},
        Circle{-4, 2.5, 12},
    };
    for (const auto& shape : shapes) {
        auto parsed = geometryFromJson(toJson(shape));
        ASSERT_TRUE(parsed.has_value()) << parsed.error();
        EXPECT_EQ(*parsed, shape);
    }
}

TEST_F(GeometryJsonTest, MissingTypeMeansPolygon) {
    auto parsed = geometryFromJson({{"points", {0, 0, 5, 0, 5, 5}}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(typeOf(*parsed), GeometryType::Polygon);
}

TEST_F(GeometryJsonTest, MissingNumbersDefaultToZero) {
    auto parsed = geometryFromJson({{"type", "circle"}, {"radius", 3}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::get<Circle>(*parsed), (Circle{0, 0, 3}));
}

TEST_F(GeometryJsonTest, RejectsMalformedInput) {
    EXPECT_FALSE(geometryFromJson(nlohmann::json::array()).has_value());
    EXPECT_FALSE(geometryFromJson({{"type", "hexagon"}}).has_value());
    EXPECT_FALSE(
        geometryFromJson({{"type", "circle"}, {"radius", "big"}}).has_value());
    EXPECT_FALSE(
        geometryFromJson({{"type", "polygon"}, {"points", "0,0"}}).has_value());
    EXPECT_FALSE(geometryFromJson({{"type", 3}}).has_value());
}
