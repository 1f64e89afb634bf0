// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "geometry_json.hpp"

#include <optional>
#include <type_traits>

namespace reaches::realm::geometry {

namespace {

/**
 * @brief Read an optional numeric field
 *
 * @return Value (0 if absent or null), or std::nullopt if present but not a
 * number
 */
auto getNumber(const nlohmann::json& obj, const char* key)
    -> std::optional<double> {
    if (!obj.contains(key) || obj[key].is_null()) {
        return 0.0;
    }
    if (!obj[key].is_number()) {
        return std::nullopt;
    }
    return obj[key].get<double>();
}

}  // namespace

auto toJson(const Geometry& geometry) -> nlohmann::json {
    nlohmann::json j;
    j["type"] = geometryTypeToString(typeOf(geometry));

    std::visit(
        [&j](const auto& shape) {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, Polygon>) {
                j["points"] = shape.points;
            } else if constexpr (std::is_same_v<T, Rectangle>) {
                j["x"] = shape.x;
                j["y"] = shape.y;
                j["width"] = shape.width;
                j["height"] = shape.height;
                j["rotation"] = shape.rotation;
            } else {
                j["x"] = shape.x;
                j["y"] = shape.y;
                j["radius"] = shape.radius;
            }
        },
        geometry);

    return j;
}

auto geometryFromJson(const nlohmann::json& j)
    -> std::expected<Geometry, std::string> {
    if (!j.is_object()) {
        return std::unexpected("Geometry must be a JSON object");
    }

    std::string typeName = "polygon";
    if (j.contains("type")) {
        if (!j["type"].is_string()) {
            return std::unexpected("Geometry type must be a string");
        }
        typeName = j["type"].get<std::string>();
    }

    auto type = geometryTypeFromString(typeName);
    if (!type) {
        return std::unexpected("Unknown geometry type: " + typeName);
    }

    switch (*type) {
        case GeometryType::Polygon: {
            Polygon polygon;
            if (j.contains("points") && !j["points"].is_null()) {
                if (!j["points"].is_array()) {
                    return std::unexpected("Polygon points must be an array");
                }
                for (const auto& value : j["points"]) {
                    if (!value.is_number()) {
                        return std::unexpected(
                            "Polygon points must be numbers");
                    }
                    polygon.points.push_back(value.get<double>());
                }
            }
            return polygon;
        }
        case GeometryType::Rectangle: {
            auto x = getNumber(j, "x");
            auto y = getNumber(j, "y");
            auto width = getNumber(j, "width");
            auto height = getNumber(j, "height");
            auto rotation = getNumber(j, "rotation");
            if (!x || !y || !width || !height || !rotation) {
                return std::unexpected("Rectangle fields must be numbers");
            }
            return Rectangle{*x, *y, *width, *height, *rotation};
        }
        case GeometryType::Circle: {
            auto x = getNumber(j, "x");
            auto y = getNumber(j, "y");
            auto radius = getNumber(j, "radius");
            if (!x || !y || !radius) {
                return std::unexpected("Circle fields must be numbers");
            }
            return Circle{*x, *y, *radius};
        }
    }

    return std::unexpected("Unknown geometry type: " + typeName);
}

}  // namespace reaches::realm::geometry
