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

#ifndef REACHES_REALM_MODEL_REGION_HPP
#define REACHES_REALM_MODEL_REGION_HPP

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "realm/geometry/shape.hpp"
#include "realm/tag/tag_validator.hpp"
#include "timestamp.hpp"

namespace reaches::realm::model {

/// Data version written into new region metadata
inline constexpr std::string_view REGION_DATA_VERSION = "1.0.0";

/// Author recorded when nobody is named
inline constexpr std::string_view UNKNOWN_AUTHOR = "Unknown";

/**
 * @brief Bookkeeping attached to every region
 */
struct RegionMetadata {
    Timestamp created = 0;
    Timestamp modified = 0;
    std::string author{UNKNOWN_AUTHOR};
    std::string version{REGION_DATA_VERSION};

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Read metadata, falling back field-by-field
     *
     * Timestamps may be integers (milliseconds) or ISO-8601 strings.
     *
     * @param j Metadata object
     * @param fallback Values for missing fields
     * @return Metadata, or error text for wrongly typed fields
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j,
                                       const RegionMetadata& fallback)
        -> std::expected<RegionMetadata, std::string>;

    auto operator==(const RegionMetadata&) const -> bool = default;
};

/**
 * @brief A named, tagged area of the plane
 *
 * Tags are unique and valid. A tag in a single-valued namespace replaces
 * any tag of the same key when added. Mutators do not stamp
 * metadata.modified; the owning store calls touch() once per update.
 */
class Region {
public:
    Region() = default;

    /**
     * @brief Construct an untagged region
     *
     * @param id Immutable identifier
     * @param name Display name; empty selects "Realm <first 8 of id>"
     * @param geometry Shape
     * @param metadata Initial metadata
     */
    Region(std::string id, std::string name, geometry::Geometry geometry,
           RegionMetadata metadata = {});

    // ==================== Identity ====================

    [[nodiscard]] auto id() const noexcept -> const std::string& {
        return id_;
    }

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

    /// Empty names are replaced with the default name
    void setName(std::string name);

    [[nodiscard]] static auto defaultName(std::string_view id) -> std::string;

    /**
     * @brief Copy of this region under another id
     *
     * Name, geometry, tags and metadata are kept as they are.
     */
    [[nodiscard]] auto withId(std::string id) const -> Region;

    // ==================== Geometry ====================

    [[nodiscard]] auto geometry() const noexcept -> const geometry::Geometry& {
        return geometry_;
    }

    void setGeometry(geometry::Geometry geometry) {
        geometry_ = std::move(geometry);
    }

    [[nodiscard]] auto containsPoint(double x, double y) const -> bool;

    [[nodiscard]] auto bounds() const -> geometry::BoundingBox;

    // ==================== Tags ====================

    /**
     * @brief Tags sorted lexicographically
     */
    [[nodiscard]] auto tags() const -> std::vector<std::string>;

    /**
     * @brief Tags in the order they were added
     */
    [[nodiscard]] auto rawTags() const noexcept
        -> const std::vector<std::string>& {
        return tags_;
    }

    [[nodiscard]] auto tagCount() const noexcept -> size_t {
        return tags_.size();
    }

    /**
     * @brief Value of the first tag with the given key
     */
    [[nodiscard]] auto tag(std::string_view key) const
        -> std::optional<std::string>;

    /**
     * @brief Numeric value of the first tag with the given key
     *
     * @return Value, or nullopt if the key is absent or not numeric
     */
    [[nodiscard]] auto tagNumber(std::string_view key) const
        -> std::optional<double>;

    /**
     * @brief Check for a tag or a key
     *
     * @param tagOrKey Full tag if it contains a colon, otherwise a key
     */
    [[nodiscard]] auto hasTag(std::string_view tagOrKey) const -> bool;

    /**
     * @brief Sorted tags whose key equals prefix
     */
    [[nodiscard]] auto tagsWithPrefix(std::string_view prefix) const
        -> std::vector<std::string>;

    /**
     * @brief Add one tag
     *
     * Duplicates are no-ops. A single-valued key replaces its prior tag.
     *
     * @return Nothing, or the validation failure (region unchanged)
     */
    auto addTag(std::string_view tag) -> std::expected<void, tag::TagError>;

    /**
     * @brief Add several tags, all or nothing
     *
     * Every tag is validated before any is added.
     */
    auto addTags(std::span<const std::string> tags)
        -> std::expected<void, tag::TagError>;

    /**
     * @brief Replace all tags, all or nothing
     */
    auto setTags(std::span<const std::string> tags)
        -> std::expected<void, tag::TagError>;

    /**
     * @brief Remove an exact tag
     *
     * @return true if the tag was present
     */
    auto removeTag(std::string_view tag) -> bool;

    /**
     * @brief Remove every tag with the given key
     *
     * @return Number of tags removed
     */
    auto removeTagsByKey(std::string_view key) -> size_t;

    /**
     * @brief Remove all tags
     *
     * @return true if there were any
     */
    auto clearTags() -> bool;

    /**
     * @brief Replace tags as authored, without single-valued replacement
     *
     * Each tag must still be valid; duplicates are dropped.
     */
    auto restoreTags(std::span<const std::string> tags)
        -> std::expected<void, tag::TagError>;

    // ==================== Metadata ====================

    [[nodiscard]] auto metadata() const noexcept -> const RegionMetadata& {
        return metadata_;
    }

    /// Stamp metadata.modified
    void touch(Timestamp now) noexcept { metadata_.modified = now; }

    // ==================== Serialization ====================

    /**
     * @brief Export record {id, name, geometry, tags, metadata}
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Build a region from an export record
     *
     * Tags are restored as authored. A missing geometry is an empty
     * polygon, missing tags are empty, and missing metadata fields take
     * their value from fallbackMetadata.
     *
     * @param j Record object
     * @param fallbackMetadata Metadata used for absent fields
     * @return Region, or error text describing the bad field
     */
    [[nodiscard]] static auto fromJson(
        const nlohmann::json& j, const RegionMetadata& fallbackMetadata = {})
        -> std::expected<Region, std::string>;

    /**
     * @brief Equality over id, name, geometry, metadata and the tag set
     *
     * Tag insertion order is ignored.
     */
    auto operator==(const Region& other) const -> bool;

private:
    void insertTag(std::string tag);

    std::string id_;
    std::string name_;
    geometry::Geometry geometry_;
    std::vector<std::string> tags_;
    RegionMetadata metadata_;
};

}  // namespace reaches::realm::model

#endif  // REACHES_REALM_MODEL_REGION_HPP
