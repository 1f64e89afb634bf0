// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_GEOMETRY_GEOMETRY_JSON_HPP
#define REACHES_REALM_GEOMETRY_GEOMETRY_JSON_HPP

#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "shape.hpp"

namespace reaches::realm::geometry {

/**
 * @brief Encode a shape as {"type": ..., <fields>}
 *
 * Polygons carry "points"; rectangles "x", "y", "width", "height",
 * "rotation"; circles "x", "y", "radius".
 */
[[nodiscard]] auto toJson(const Geometry& geometry) -> nlohmann::json;

/**
 * @brief Decode a shape written by toJson()
 *
 * Missing numeric fields default to 0 and a missing point list yields an
 * empty polygon. Unknown "type" values and non-numeric fields are errors.
 */
[[nodiscard]] auto geometryFromJson(const nlohmann::json& j)
    -> std::expected<Geometry, std::string>;

}  // namespace reaches::realm::geometry

#endif  // REACHES_REALM_GEOMETRY_GEOMETRY_JSON_HPP
