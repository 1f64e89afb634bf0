// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#ifndef REACHES_REALM_GEOMETRY_SHAPE_HPP
#define REACHES_REALM_GEOMETRY_SHAPE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace reaches::realm::geometry {

/**
 * @brief Axis-aligned bounding box in plane coordinates
 *
 * (x, y) is the minimum corner. Width and height are never negative for
 * boxes produced by bounds().
 */
struct BoundingBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    [[nodiscard]] auto right() const noexcept -> double { return x + width; }
    [[nodiscard]] auto bottom() const noexcept -> double { return y + height; }

    [[nodiscard]] auto area() const noexcept -> double {
        return width * height;
    }

    /**
     * @brief Check if a point lies inside the box (edges inclusive)
     */
    [[nodiscard]] auto contains(double px, double py) const noexcept -> bool {
        return px >= x && px <= right() && py >= y && py <= bottom();
    }

    auto operator==(const BoundingBox&) const -> bool = default;
};

/**
 * @brief Polygon stored as a flat coordinate array [x1, y1, x2, y2, ...]
 *
 * Fewer than three vertices is an empty shape.
 */
struct Polygon {
    std::vector<double> points;

    [[nodiscard]] auto vertexCount() const noexcept -> size_t {
        return points.size() / 2;
    }

    [[nodiscard]] auto isEmpty() const noexcept -> bool {
        return vertexCount() < 3;
    }

    auto operator==(const Polygon&) const -> bool = default;
};

/**
 * @brief Rectangle given by centre, extents and rotation in radians
 */
struct Rectangle {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;

    auto operator==(const Rectangle&) const -> bool = default;
};

struct Circle {
    double x = 0.0;
    double y = 0.0;
    double radius = 0.0;

    auto operator==(const Circle&) const -> bool = default;
};

/// Closed set of region shapes
using Geometry = std::variant<Polygon, Rectangle, Circle>;

enum class GeometryType { Polygon = 0, Rectangle = 1, Circle = 2 };

[[nodiscard]] auto typeOf(const Geometry& geometry) noexcept -> GeometryType;

[[nodiscard]] auto geometryTypeToString(GeometryType type) -> std::string;

/**
 * @brief Parse "polygon", "rectangle" or "circle"
 *
 * @return Type, or std::nullopt for anything else
 */
[[nodiscard]] auto geometryTypeFromString(std::string_view name)
    -> std::optional<GeometryType>;

/**
 * @brief Point containment test
 *
 * Polygons use ray casting, rotated rectangles are tested in their local
 * frame, circles compare squared distances. Empty shapes contain nothing.
 */
[[nodiscard]] auto contains(const Geometry& geometry, double x, double y)
    -> bool;

/**
 * @brief Axis-aligned bounding box of a shape
 *
 * Rectangle rotation is ignored. Empty polygons yield the zero box at the
 * origin.
 */
[[nodiscard]] auto bounds(const Geometry& geometry) -> BoundingBox;

/**
 * @brief Axis-aligned box covering every point contains() accepts
 *
 * Same as bounds() except for rotated rectangles, whose box is widened to
 * enclose the rotated corners.
 */
[[nodiscard]] auto footprint(const Geometry& geometry) -> BoundingBox;

/**
 * @brief AABB overlap test; touching edges count as overlapping
 */
[[nodiscard]] auto intersects(const BoundingBox& a,
                              const BoundingBox& b) noexcept -> bool;

/**
 * @brief Build a polygon from an axis-aligned box (clockwise from min corner)
 */
[[nodiscard]] auto polygonFromBox(const BoundingBox& box) -> Polygon;

}  // namespace reaches::realm::geometry

#endif  // REACHES_REALM_GEOMETRY_SHAPE_HPP
