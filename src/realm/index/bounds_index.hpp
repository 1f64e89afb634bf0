// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_INDEX_BOUNDS_INDEX_HPP
#define REACHES_REALM_INDEX_BOUNDS_INDEX_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "realm/geometry/shape.hpp"

namespace reaches::realm::index {

/**
 * @brief Cache of region bounding boxes in insertion order
 *
 * Serves as the cheap pre-filter in front of exact containment tests:
 * - Point candidates (bounding box contains the point)
 * - Box candidates (bounding boxes intersect)
 *
 * Entries keep the position of their first insertion; re-inserting an id
 * only refreshes its box. Stores are sized in thousands of regions, so a
 * flat scan over contiguous boxes is used instead of a tree.
 *
 * Not thread-safe; the owning store is single-threaded.
 *
 * @example
 * ```cpp
 * BoundsIndex index;
 * index.insert("a1", {0, 0, 50, 50});
 * auto hits = index.candidatesAt(25, 25);  // {"a1"}
 * ```
 */
class BoundsIndex {
public:
    using ObjectId = std::string;

    BoundsIndex() = default;

    BoundsIndex(const BoundsIndex&) = default;
    BoundsIndex& operator=(const BoundsIndex&) = default;
    BoundsIndex(BoundsIndex&&) noexcept = default;
    BoundsIndex& operator=(BoundsIndex&&) noexcept = default;

    ~BoundsIndex() = default;

    /**
     * @brief Insert or refresh an entry
     *
     * @param id Region id
     * @param box Bounding box of the region's geometry
     * @param reach Box covering every point the geometry contains; point
     *        candidates are filtered against it
     */
    void insert(const ObjectId& id, const geometry::BoundingBox& box,
                const geometry::BoundingBox& reach);

    void insert(const ObjectId& id, const geometry::BoundingBox& box) {
        insert(id, box, box);
    }

    /**
     * @brief Remove an entry
     *
     * @return true if the id was indexed
     */
    auto remove(const ObjectId& id) -> bool;

    void clear();

    [[nodiscard]] auto size() const noexcept -> size_t {
        return entries_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return entries_.empty();
    }

    [[nodiscard]] auto contains(const ObjectId& id) const -> bool;

    [[nodiscard]] auto boundsOf(const ObjectId& id) const
        -> std::optional<geometry::BoundingBox>;

    [[nodiscard]] auto reachOf(const ObjectId& id) const
        -> std::optional<geometry::BoundingBox>;

    /**
     * @brief Ids whose reach box contains the point (inclusive)
     */
    [[nodiscard]] auto candidatesAt(double x, double y) const
        -> std::vector<ObjectId>;

    /**
     * @brief Ids whose bounding box intersects the box
     *
     * @param box Query box
     * @param limit Maximum results, 0 for unlimited
     */
    [[nodiscard]] auto searchBox(const geometry::BoundingBox& box,
                                 size_t limit = 0) const
        -> std::vector<ObjectId>;

    /**
     * @brief All ids in insertion order
     */
    [[nodiscard]] auto ids() const -> std::vector<ObjectId>;

private:
    struct Entry {
        ObjectId id;
        geometry::BoundingBox box;
        geometry::BoundingBox reach;
    };

    void reindexFrom(size_t position);

    std::vector<Entry> entries_;
    std::unordered_map<ObjectId, size_t> positions_;
};

}  // namespace reaches::realm::index

#endif  // REACHES_REALM_INDEX_BOUNDS_INDEX_HPP
