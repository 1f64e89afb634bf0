// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "bounds_index.hpp"

#include <cstddef>

#include "spdlog/spdlog.h"

namespace reaches::realm::index {

void BoundsIndex::insert(const ObjectId& id, const geometry::BoundingBox& box,
                         const geometry::BoundingBox& reach) {
    auto it = positions_.find(id);
    if (it != positions_.end()) {
        entries_[it->second].box = box;
        entries_[it->second].reach = reach;
        SPDLOG_DEBUG("Refreshed bounds for {}", id);
        return;
    }

    positions_.emplace(id, entries_.size());
    entries_.push_back({id, box, reach});
    SPDLOG_DEBUG("Indexed {} at ({}, {}) size {}x{}", id, box.x, box.y,
                 box.width, box.height);
}

auto BoundsIndex::remove(const ObjectId& id) -> bool {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return false;
    }

    size_t position = it->second;
    positions_.erase(it);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(position));
    reindexFrom(position);
    return true;
}

void BoundsIndex::clear() {
    entries_.clear();
    positions_.clear();
}

auto BoundsIndex::contains(const ObjectId& id) const -> bool {
    return positions_.find(id) != positions_.end();
}

auto BoundsIndex::boundsOf(const ObjectId& id) const
    -> std::optional<geometry::BoundingBox> {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].box;
}

auto BoundsIndex::reachOf(const ObjectId& id) const
    -> std::optional<geometry::BoundingBox> {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].reach;
}

auto BoundsIndex::candidatesAt(double x, double y) const
    -> std::vector<ObjectId> {
    std::vector<ObjectId> results;
    for (const auto& entry : entries_) {
        if (entry.reach.contains(x, y)) {
            results.push_back(entry.id);
        }
    }
    return results;
}

auto BoundsIndex::searchBox(const geometry::BoundingBox& box,
                            size_t limit) const -> std::vector<ObjectId> {
    std::vector<ObjectId> results;
    for (const auto& entry : entries_) {
        if (limit > 0 && results.size() >= limit) {
            break;
        }
        if (geometry::intersects(entry.box, box)) {
            results.push_back(entry.id);
        }
    }
    return results;
}

auto BoundsIndex::ids() const -> std::vector<ObjectId> {
    std::vector<ObjectId> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.id);
    }
    return result;
}

void BoundsIndex::reindexFrom(size_t position) {
    for (size_t i = position; i < entries_.size(); ++i) {
        positions_[entries_[i].id] = i;
    }
}

}  // namespace reaches::realm::index
