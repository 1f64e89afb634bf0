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

#ifndef REACHES_REALM_SERVICE_REALM_ENGINE_HPP
#define REACHES_REALM_SERVICE_REALM_ENGINE_HPP

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "realm/core/engine_config.hpp"
#include "realm/core/error.hpp"
#include "realm/io/document_codec.hpp"
#include "realm/model/region.hpp"
#include "realm/model/region_patch.hpp"
#include "realm/model/region_query.hpp"
#include "realm/store/region_store.hpp"
#include "realm/tag/tag_registry.hpp"

namespace reaches::realm::service {

/**
 * @brief Single entry point for hosts
 *
 * Owns one RegionStore, one TagRegistry and one DocumentCodec for a
 * scope. Hosts create one engine per scene or document and pass it
 * around explicitly.
 *
 * Example usage:
 * @code
 * RealmEngine engine(EngineConfig::withAnnotatorDefaults());
 * auto region = engine.createRegion(
 *     "Marsh", geometry::Circle{75, 75, 25}, {"biome:swamp"});
 * auto here = engine.queryPoint(80, 80);
 * auto doc = engine.exportStore();
 * @endcode
 */
class RealmEngine {
public:
    /**
     * @brief Construct an engine with an empty store
     *
     * @param config Engine configuration
     * @param clock Time source, empty for the system clock
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit RealmEngine(const EngineConfig& config = EngineConfig(),
                         model::Clock clock = {});

    ~RealmEngine();

    RealmEngine(const RealmEngine&) = delete;
    RealmEngine& operator=(const RealmEngine&) = delete;

    RealmEngine(RealmEngine&&) noexcept;
    RealmEngine& operator=(RealmEngine&&) noexcept;

    /**
     * @brief Build an engine from JSON config text
     *
     * Installs the configured console logger before constructing.
     *
     * @param configText EngineConfig JSON
     * @return Engine, or the configuration error
     */
    [[nodiscard]] static auto fromConfigText(std::string_view configText)
        -> std::expected<RealmEngine, std::string>;

    // ========================================================================
    // Tags
    // ========================================================================

    [[nodiscard]] auto validateTag(std::string_view tag) const -> bool;

    /**
     * @brief Validate a tag, reporting why it fails
     */
    [[nodiscard]] auto checkTag(std::string_view tag) const
        -> std::expected<void, tag::TagError>;

    [[nodiscard]] auto suggestTags(std::string_view partial,
                                   std::span<const std::string> existingTags)
        const -> std::vector<tag::TagSuggestion>;

    [[nodiscard]] auto detectConflicts(std::span<const std::string> tags) const
        -> std::vector<std::string>;

    [[nodiscard]] auto biomePreset(std::string_view biome) const
        -> std::vector<std::string>;

    // ========================================================================
    // Regions
    // ========================================================================

    /**
     * @brief Create a region
     *
     * @param name Display name, empty for the default
     * @param geometry Shape
     * @param tags Initial tags
     * @param author Author, defaults to the configured author
     * @return Created region, or InvalidTag
     */
    auto createRegion(std::string name, geometry::Geometry geometry,
                      std::vector<std::string> tags = {},
                      std::optional<std::string> author = std::nullopt)
        -> std::expected<model::Region, RealmError>;

    auto updateRegion(const std::string& id, const model::RegionPatch& patch)
        -> std::expected<model::Region, RealmError>;

    auto deleteRegion(const std::string& id) -> bool;

    [[nodiscard]] auto getRegion(const std::string& id) const
        -> std::optional<model::Region>;

    [[nodiscard]] auto regions() const -> std::vector<model::Region>;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto queryPoint(double x, double y) const
        -> std::vector<model::Region>;

    [[nodiscard]] auto queryBounds(const geometry::BoundingBox& box) const
        -> std::vector<model::Region>;

    [[nodiscard]] auto queryTags(std::span<const std::string> tags) const
        -> std::vector<model::Region>;

    [[nodiscard]] auto findRegions(const model::RegionQuery& query) const
        -> std::vector<model::Region>;

    [[nodiscard]] auto regionAt(double x, double y) const
        -> std::optional<model::Region>;

    [[nodiscard]] auto statistics() const -> store::StoreStatistics;

    // ========================================================================
    // Import / Export
    // ========================================================================

    [[nodiscard]] auto exportStore(const io::ExportOptions& options = {}) const
        -> io::ExportDocument;

    /**
     * @brief Export as JSON text
     */
    [[nodiscard]] auto exportText(int indent = 2) const -> std::string;

    auto importStore(const nlohmann::json& document,
                     io::ImportPolicy policy = io::ImportPolicy::Skip)
        -> std::expected<io::ImportResult, RealmError>;

    auto importStore(const io::ExportDocument& document,
                     io::ImportPolicy policy = io::ImportPolicy::Skip)
        -> std::expected<io::ImportResult, RealmError>;

    /**
     * @brief Import from JSON text
     *
     * @return Import statistics, or MalformedDocument for bad JSON
     */
    auto importText(std::string_view text,
                    io::ImportPolicy policy = io::ImportPolicy::Skip)
        -> std::expected<io::ImportResult, RealmError>;

    [[nodiscard]] auto exportScene(const io::ExportOptions& options = {}) const
        -> nlohmann::json;

    auto importScene(const nlohmann::json& bundle)
        -> std::expected<io::ImportResult, RealmError>;

    // ========================================================================
    // Components
    // ========================================================================

    [[nodiscard]] auto regionStore() -> store::RegionStore&;
    [[nodiscard]] auto regionStore() const -> const store::RegionStore&;
    [[nodiscard]] auto registry() const -> const tag::TagRegistry&;
    [[nodiscard]] auto config() const -> const EngineConfig&;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace reaches::realm::service

#endif  // REACHES_REALM_SERVICE_REALM_ENGINE_HPP
