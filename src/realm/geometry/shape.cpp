// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "shape.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace reaches::realm::geometry {

namespace {

auto pointInPolygon(const Polygon& polygon, double x, double y) -> bool {
    if (polygon.isEmpty()) {
        return false;
    }

    const auto& pts = polygon.points;
    const size_t n = polygon.vertexCount();
    bool inside = false;

    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        double xi = pts[i * 2];
        double yi = pts[i * 2 + 1];
        double xj = pts[j * 2];
        double yj = pts[j * 2 + 1];

        if ((yi > y) != (yj > y) &&
            x < (xj - xi) * (y - yi) / (yj - yi) + xi) {
            inside = !inside;
        }
    }

    return inside;
}

auto pointInRectangle(const Rectangle& rect, double x, double y) -> bool {
    double halfWidth = rect.width / 2.0;
    double halfHeight = rect.height / 2.0;

    if (rect.rotation == 0.0) {
        return x >= rect.x - halfWidth && x <= rect.x + halfWidth &&
               y >= rect.y - halfHeight && y <= rect.y + halfHeight;
    }

    // Rotate the point back into the rectangle's local frame
    double cosR = std::cos(-rect.rotation);
    double sinR = std::sin(-rect.rotation);
    double dx = x - rect.x;
    double dy = y - rect.y;
    double localX = dx * cosR - dy * sinR;
    double localY = dx * sinR + dy * cosR;

    return localX >= -halfWidth && localX <= halfWidth &&
           localY >= -halfHeight && localY <= halfHeight;
}

auto pointInCircle(const Circle& circle, double x, double y) -> bool {
    double dx = x - circle.x;
    double dy = y - circle.y;
    return dx * dx + dy * dy <= circle.radius * circle.radius;
}

auto polygonBounds(const Polygon& polygon) -> BoundingBox {
    if (polygon.isEmpty()) {
        return {};
    }

    const auto& pts = polygon.points;
    double minX = pts[0];
    double maxX = pts[0];
    double minY = pts[1];
    double maxY = pts[1];

    for (size_t i = 2; i + 1 < pts.size(); i += 2) {
        minX = std::min(minX, pts[i]);
        maxX = std::max(maxX, pts[i]);
        minY = std::min(minY, pts[i + 1]);
        maxY = std::max(maxY, pts[i + 1]);
    }

    return {minX, minY, maxX - minX, maxY - minY};
}

}  // namespace

auto typeOf(const Geometry& geometry) noexcept -> GeometryType {
    return static_cast<GeometryType>(geometry.index());
}

auto geometryTypeToString(GeometryType type) -> std::string {
    switch (type) {
        case GeometryType::Polygon:
            return "polygon";
        case GeometryType::Rectangle:
            return "rectangle";
        case GeometryType::Circle:
            return "circle";
        default:
            return "unknown";
    }
}

auto geometryTypeFromString(std::string_view name)
    -> std::optional<GeometryType> {
    if (name == "polygon") return GeometryType::Polygon;
    if (name == "rectangle") return GeometryType::Rectangle;
    if (name == "circle") return GeometryType::Circle;
    return std::nullopt;
}

auto contains(const Geometry& geometry, double x, double y) -> bool {
    return std::visit(
        [x, y](const auto& shape) -> bool {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, Polygon>) {
                return pointInPolygon(shape, x, y);
            } else if constexpr (std::is_same_v<T, Rectangle>) {
                return pointInRectangle(shape, x, y);
            } else {
                return pointInCircle(shape, x, y);
            }
        },
        geometry);
}

auto bounds(const Geometry& geometry) -> BoundingBox {
    return std::visit(
        [](const auto& shape) -> BoundingBox {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, Polygon>) {
                return polygonBounds(shape);
            } else if constexpr (std::is_same_v<T, Rectangle>) {
                double w = std::abs(shape.width);
                double h = std::abs(shape.height);
                return {shape.x - w / 2.0, shape.y - h / 2.0, w, h};
            } else {
                double r = std::abs(shape.radius);
                return {shape.x - r, shape.y - r, r * 2.0, r * 2.0};
            }
        },
        geometry);
}

auto footprint(const Geometry& geometry) -> BoundingBox {
    const auto* rect = std::get_if<Rectangle>(&geometry);
    if (rect == nullptr || rect->rotation == 0.0) {
        return bounds(geometry);
    }

    double w = std::abs(rect->width);
    double h = std::abs(rect->height);
    double c = std::abs(std::cos(rect->rotation));
    double s = std::abs(std::sin(rect->rotation));
    double halfW = (w * c + h * s) / 2.0;
    double halfH = (w * s + h * c) / 2.0;
    return {rect->x - halfW, rect->y - halfH, halfW * 2.0, halfH * 2.0};
}

auto intersects(const BoundingBox& a, const BoundingBox& b) noexcept -> bool {
    return !(a.right() < b.x || b.right() < a.x || a.bottom() < b.y ||
             b.bottom() < a.y);
}

auto polygonFromBox(const BoundingBox& box) -> Polygon {
    return Polygon{{box.x, box.y, box.right(), box.y, box.right(),
                    box.bottom(), box.x, box.bottom()}};
}

}  // namespace reaches::realm::geometry
