// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_MODEL_REGION_PATCH_HPP
#define REACHES_REALM_MODEL_REGION_PATCH_HPP

#include <optional>
#include <string>
#include <vector>

#include "realm/geometry/shape.hpp"

namespace reaches::realm::model {

/**
 * @brief Request to create a region
 */
struct CreateRequest {
    std::string name;
    geometry::Geometry geometry;
    std::vector<std::string> tags;

    /// Defaults to the store's configured author
    std::optional<std::string> author;
};

/**
 * @brief Partial update of a region
 *
 * Applied in order: name, geometry, tag replacement, removals, additions.
 * An empty patch still stamps metadata.modified.
 */
struct RegionPatch {
    std::optional<std::string> name;
    std::optional<geometry::Geometry> geometry;

    /// Replaces every tag when set
    std::optional<std::vector<std::string>> tags;

    std::vector<std::string> removeTags;
    std::vector<std::string> addTags;

    [[nodiscard]] auto isEmpty() const noexcept -> bool {
        return !name && !geometry && !tags && removeTags.empty() &&
               addTags.empty();
    }
};

}  // namespace reaches::realm::model

#endif  // REACHES_REALM_MODEL_REGION_PATCH_HPP
