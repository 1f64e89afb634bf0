// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_MODEL_REGION_QUERY_HPP
#define REACHES_REALM_MODEL_REGION_QUERY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "realm/geometry/shape.hpp"

namespace reaches::realm::model {

/**
 * @brief Combined filter for region searches
 *
 * Present filters are ANDed. Results keep store insertion order and the
 * limit is applied after filtering.
 */
struct RegionQuery {
    // ==================== Filters ====================

    /// Every listed tag must be present (exact match)
    std::optional<std::vector<std::string>> tags;

    /// Region bounds must intersect this box
    std::optional<geometry::BoundingBox> bounds;

    /// Region must contain this point
    std::optional<std::pair<double, double>> point;

    // ==================== Pagination ====================

    /// Maximum results, 0 for unlimited
    size_t limit = 0;

    [[nodiscard]] auto isUnfiltered() const noexcept -> bool {
        return !tags && !bounds && !point;
    }

    [[nodiscard]] static auto withTags(std::vector<std::string> required)
        -> RegionQuery {
        RegionQuery query;
        query.tags = std::move(required);
        return query;
    }

    [[nodiscard]] static auto withinBounds(const geometry::BoundingBox& box)
        -> RegionQuery {
        RegionQuery query;
        query.bounds = box;
        return query;
    }
};

}  // namespace reaches::realm::model

#endif  // REACHES_REALM_MODEL_REGION_QUERY_HPP
