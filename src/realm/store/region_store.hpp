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

#ifndef REACHES_REALM_STORE_REGION_STORE_HPP
#define REACHES_REALM_STORE_REGION_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "id_generator.hpp"
#include "store_event.hpp"

#include "realm/core/engine_config.hpp"
#include "realm/core/error.hpp"
#include "realm/index/bounds_index.hpp"
#include "realm/model/region.hpp"
#include "realm/model/region_patch.hpp"
#include "realm/model/region_query.hpp"

namespace reaches::realm::store {

/**
 * @brief Construction options for a RegionStore
 */
struct StoreOptions {
    /// Scope, default author, default tags and id length
    EngineConfig config;

    /// Time source for metadata; empty uses the system clock
    model::Clock clock;

    /// Fixed seed for id generation; empty seeds from std::random_device
    std::optional<std::uint64_t> idSeed;
};

/**
 * @brief In-memory collection of regions for one scope
 *
 * Owns every Region it holds; reads return copies. Regions are kept in
 * insertion order, which all queries preserve. Bounding boxes are cached
 * in a BoundsIndex and checked before exact containment.
 *
 * Ids are never reissued by create(), even after deletion. insert() may
 * reuse any id that is not currently live.
 *
 * Not thread-safe: hosts sharing a store across threads must guard it.
 *
 * Example usage:
 * @code
 * RegionStore store(StoreOptions{});
 * auto created = store.create({"Old Wood", geometry::Circle{75, 75, 25},
 *                              {"biome:forest"}});
 * auto hits = store.queryPoint(75, 75);
 * @endcode
 */
class RegionStore {
public:
    /**
     * @brief Create an empty store
     *
     * @param options Configuration and clock
     * @throws std::invalid_argument if the config or a default tag is
     *         invalid
     */
    explicit RegionStore(StoreOptions options = {});

    RegionStore(const RegionStore&) = delete;
    RegionStore& operator=(const RegionStore&) = delete;

    RegionStore(RegionStore&&) noexcept = default;
    RegionStore& operator=(RegionStore&&) noexcept = default;

    ~RegionStore() = default;

    // ==================== Mutations ====================

    /**
     * @brief Create a region under a fresh id
     *
     * Default tags are applied first, then the requested tags, with
     * single-valued replacement.
     *
     * @param request Name, geometry, tags and optional author
     * @return Created region, or InvalidTag (nothing stored)
     */
    auto create(const model::CreateRequest& request)
        -> std::expected<model::Region, RealmError>;

    /**
     * @brief Apply a patch to an existing region
     *
     * All tags in the patch are validated before anything changes.
     * metadata.modified is stamped even for an empty patch.
     *
     * @param id Region id
     * @param patch Changes to apply
     * @return Updated region, or NotFound / InvalidTag
     */
    auto update(const std::string& id, const model::RegionPatch& patch)
        -> std::expected<model::Region, RealmError>;

    /**
     * @brief Delete a region
     *
     * @return true if a region was removed
     */
    auto remove(const std::string& id) -> bool;

    /**
     * @brief Store a region exactly as given
     *
     * Used by import. Tags are kept as authored.
     *
     * @return Nothing, or DuplicateId if the id is live
     */
    auto insert(model::Region region) -> std::expected<void, RealmError>;

    /**
     * @brief Remove every region
     *
     * @return Number of regions removed
     */
    auto clear() -> size_t;

    // ==================== Lookups ====================

    [[nodiscard]] auto get(const std::string& id) const
        -> std::optional<model::Region>;

    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    [[nodiscard]] auto size() const noexcept -> size_t { return byId_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return byId_.empty(); }

    /**
     * @brief All regions in insertion order
     */
    [[nodiscard]] auto all() const -> std::vector<model::Region>;

    // ==================== Queries ====================

    /**
     * @brief Regions containing the point
     */
    [[nodiscard]] auto queryPoint(double x, double y) const
        -> std::vector<model::Region>;

    /**
     * @brief Regions whose bounds intersect the box
     */
    [[nodiscard]] auto queryBounds(const geometry::BoundingBox& box) const
        -> std::vector<model::Region>;

    /**
     * @brief Regions carrying every required tag
     *
     * An empty list matches every region.
     */
    [[nodiscard]] auto queryTags(std::span<const std::string> required) const
        -> std::vector<model::Region>;

    [[nodiscard]] auto findByTag(std::string_view tag) const
        -> std::vector<model::Region>;

    [[nodiscard]] auto findByTagKey(std::string_view key) const
        -> std::vector<model::Region>;

    /**
     * @brief Combined tag / bounds / point search
     */
    [[nodiscard]] auto find(const model::RegionQuery& query) const
        -> std::vector<model::Region>;

    /**
     * @brief First region containing the point
     */
    [[nodiscard]] auto regionAt(double x, double y) const
        -> std::optional<model::Region>;

    [[nodiscard]] auto statistics() const -> StoreStatistics;

    // ==================== Listeners ====================

    /**
     * @brief Register a change listener
     *
     * Exceptions thrown by listeners are logged and ignored.
     *
     * @return Handle for removeListener()
     */
    auto addListener(StoreListener listener) -> ListenerId;

    auto removeListener(ListenerId id) -> bool;

    /**
     * @brief Announce a finished bulk import to listeners
     *
     * @param count Regions stored by the import
     */
    void notifyImported(size_t count) const;

    // ==================== Accessors ====================

    /**
     * @brief Fresh id, never live and never previously issued or deleted
     */
    [[nodiscard]] auto generateId() -> std::string;

    [[nodiscard]] auto now() const -> model::Timestamp;

    [[nodiscard]] auto scope() const noexcept -> const std::string& {
        return config_.scope;
    }

    [[nodiscard]] auto defaultAuthor() const noexcept -> const std::string& {
        return config_.defaultAuthor;
    }

    [[nodiscard]] auto config() const noexcept -> const EngineConfig& {
        return config_;
    }

private:
    void publish(const StoreEvent& event) const;

    [[nodiscard]] auto collect(const std::vector<std::string>& ids) const
        -> std::vector<model::Region>;

    [[nodiscard]] static auto hasAllTags(const model::Region& region,
                                         std::span<const std::string> required)
        -> bool;

    EngineConfig config_;
    model::Clock clock_;
    IdGenerator idGenerator_;

    std::unordered_map<std::string, model::Region> byId_;
    index::BoundsIndex index_;
    std::unordered_set<std::string> issuedIds_;

    std::vector<std::pair<ListenerId, StoreListener>> listeners_;
    ListenerId nextListenerId_ = 1;
};

}  // namespace reaches::realm::store

#endif  // REACHES_REALM_STORE_REGION_STORE_HPP
