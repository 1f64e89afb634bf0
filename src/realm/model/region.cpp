// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "region.hpp"

#include <algorithm>
#include <cmath>

#include "realm/geometry/geometry_json.hpp"

namespace reaches::realm::model {

namespace {

auto readTimestamp(const nlohmann::json& j, const char* field,
                   Timestamp fallback)
    -> std::expected<Timestamp, std::string> {
    if (!j.contains(field) || j[field].is_null()) {
        return fallback;
    }
    const auto& value = j[field];
    if (value.is_number_integer()) {
        return value.get<Timestamp>();
    }
    if (value.is_number_float()) {
        return static_cast<Timestamp>(std::llround(value.get<double>()));
    }
    if (value.is_string()) {
        if (auto parsed = parseIsoTimestamp(value.get<std::string>())) {
            return *parsed;
        }
        return std::unexpected("Invalid timestamp in metadata." +
                               std::string(field));
    }
    return std::unexpected("Field metadata." + std::string(field) +
                           " must be a number or ISO-8601 string");
}

auto readString(const nlohmann::json& j, const char* field,
                const std::string& fallback)
    -> std::expected<std::string, std::string> {
    if (!j.contains(field) || j[field].is_null()) {
        return fallback;
    }
    if (!j[field].is_string()) {
        return std::unexpected("Field " + std::string(field) +
                               " must be a string");
    }
    return j[field].get<std::string>();
}

}  // namespace

// ==================== RegionMetadata ====================

auto RegionMetadata::toJson() const -> nlohmann::json {
    return {{"created", created},
            {"modified", modified},
            {"author", author},
            {"version", version}};
}

auto RegionMetadata::fromJson(const nlohmann::json& j,
                              const RegionMetadata& fallback)
    -> std::expected<RegionMetadata, std::string> {
    if (!j.is_object()) {
        return std::unexpected("Field metadata must be an object");
    }

    auto created = readTimestamp(j, "created", fallback.created);
    if (!created) {
        return std::unexpected(created.error());
    }
    auto modified = readTimestamp(j, "modified", fallback.modified);
    if (!modified) {
        return std::unexpected(modified.error());
    }
    auto author = readString(j, "author", fallback.author);
    if (!author) {
        return std::unexpected(author.error());
    }
    auto version = readString(j, "version", fallback.version);
    if (!version) {
        return std::unexpected(version.error());
    }

    RegionMetadata metadata;
    metadata.created = *created;
    metadata.modified = *modified;
    metadata.author = std::move(*author);
    metadata.version = std::move(*version);
    return metadata;
}

// ==================== Region ====================

Region::Region(std::string id, std::string name, geometry::Geometry geometry,
               RegionMetadata metadata)
    : id_(std::move(id)),
      geometry_(std::move(geometry)),
      metadata_(std::move(metadata)) {
    setName(std::move(name));
}

void Region::setName(std::string name) {
    name_ = name.empty() ? defaultName(id_) : std::move(name);
}

auto Region::defaultName(std::string_view id) -> std::string {
    return "Realm " + std::string(id.substr(0, 8));
}

auto Region::withId(std::string id) const -> Region {
    Region copy = *this;
    copy.id_ = std::move(id);
    return copy;
}

auto Region::containsPoint(double x, double y) const -> bool {
    return geometry::contains(geometry_, x, y);
}

auto Region::bounds() const -> geometry::BoundingBox {
    return geometry::bounds(geometry_);
}

auto Region::tags() const -> std::vector<std::string> {
    auto sorted = tags_;
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

auto Region::operator==(const Region& other) const -> bool {
    return id_ == other.id_ && name_ == other.name_ &&
           geometry_ == other.geometry_ && metadata_ == other.metadata_ &&
           tags_.size() == other.tags_.size() && tags() == other.tags();
}

auto Region::tag(std::string_view key) const -> std::optional<std::string> {
    for (const auto& existing : tags_) {
        auto parts = tag::splitTag(existing);
        if (parts && parts->key == key) {
            return std::string(parts->value);
        }
    }
    return std::nullopt;
}

auto Region::tagNumber(std::string_view key) const -> std::optional<double> {
    auto value = tag(key);
    if (!value) {
        return std::nullopt;
    }
    return tag::parseNumber(*value);
}

auto Region::hasTag(std::string_view tagOrKey) const -> bool {
    if (tagOrKey.find(':') != std::string_view::npos) {
        return std::find(tags_.begin(), tags_.end(), tagOrKey) != tags_.end();
    }
    return tag(tagOrKey).has_value();
}

auto Region::tagsWithPrefix(std::string_view prefix) const
    -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& existing : tags_) {
        auto parts = tag::splitTag(existing);
        if (parts && parts->key == prefix) {
            result.push_back(existing);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void Region::insertTag(std::string tag) {
    if (std::find(tags_.begin(), tags_.end(), tag) != tags_.end()) {
        return;
    }
    auto key = tag::tagKey(tag);
    if (tag::isSingleValuedKey(key)) {
        removeTagsByKey(key);
    }
    tags_.push_back(std::move(tag));
}

auto Region::addTag(std::string_view tag)
    -> std::expected<void, tag::TagError> {
    if (auto valid = tag::validateTag(tag); !valid) {
        return std::unexpected(valid.error());
    }
    insertTag(std::string(tag));
    return {};
}

auto Region::addTags(std::span<const std::string> tags)
    -> std::expected<void, tag::TagError> {
    for (const auto& candidate : tags) {
        if (auto valid = tag::validateTag(candidate); !valid) {
            return std::unexpected(valid.error());
        }
    }
    for (const auto& candidate : tags) {
        insertTag(candidate);
    }
    return {};
}

auto Region::setTags(std::span<const std::string> tags)
    -> std::expected<void, tag::TagError> {
    for (const auto& candidate : tags) {
        if (auto valid = tag::validateTag(candidate); !valid) {
            return std::unexpected(valid.error());
        }
    }
    tags_.clear();
    for (const auto& candidate : tags) {
        insertTag(candidate);
    }
    return {};
}

auto Region::removeTag(std::string_view tag) -> bool {
    auto it = std::find(tags_.begin(), tags_.end(), tag);
    if (it == tags_.end()) {
        return false;
    }
    tags_.erase(it);
    return true;
}

auto Region::removeTagsByKey(std::string_view key) -> size_t {
    // Copy the key: it may view into a tag that is about to be erased
    std::string wanted(key);
    auto removed = std::erase_if(tags_, [&wanted](const std::string& existing) {
        auto parts = tag::splitTag(existing);
        return parts && parts->key == wanted;
    });
    return static_cast<size_t>(removed);
}

auto Region::clearTags() -> bool {
    bool hadTags = !tags_.empty();
    tags_.clear();
    return hadTags;
}

auto Region::restoreTags(std::span<const std::string> tags)
    -> std::expected<void, tag::TagError> {
    for (const auto& candidate : tags) {
        if (auto valid = tag::validateTag(candidate); !valid) {
            return std::unexpected(valid.error());
        }
    }
    tags_.clear();
    for (const auto& candidate : tags) {
        if (std::find(tags_.begin(), tags_.end(), candidate) == tags_.end()) {
            tags_.push_back(candidate);
        }
    }
    return {};
}

auto Region::toJson() const -> nlohmann::json {
    return {{"id", id_},
            {"name", name_},
            {"geometry", geometry::toJson(geometry_)},
            {"tags", tags_},
            {"metadata", metadata_.toJson()}};
}

auto Region::fromJson(const nlohmann::json& j,
                      const RegionMetadata& fallbackMetadata)
    -> std::expected<Region, std::string> {
    if (!j.is_object()) {
        return std::unexpected("Region record must be an object");
    }
    if (!j.contains("id") || !j["id"].is_string() ||
        j["id"].get<std::string>().empty()) {
        return std::unexpected("Missing or invalid field: id");
    }

    auto name = readString(j, "name", "");
    if (!name) {
        return std::unexpected(name.error());
    }

    geometry::Geometry shape = geometry::Polygon{};
    if (j.contains("geometry") && !j["geometry"].is_null()) {
        auto parsed = geometry::geometryFromJson(j["geometry"]);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        shape = std::move(*parsed);
    }

    std::vector<std::string> tags;
    if (j.contains("tags") && !j["tags"].is_null()) {
        if (!j["tags"].is_array()) {
            return std::unexpected("Field tags must be an array");
        }
        for (const auto& item : j["tags"]) {
            if (!item.is_string()) {
                return std::unexpected("Tags must be strings");
            }
            tags.push_back(item.get<std::string>());
        }
    }

    RegionMetadata metadata = fallbackMetadata;
    if (j.contains("metadata") && !j["metadata"].is_null()) {
        auto parsed = RegionMetadata::fromJson(j["metadata"], fallbackMetadata);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        metadata = std::move(*parsed);
    }

    Region region(j["id"].get<std::string>(), std::move(*name),
                  std::move(shape), std::move(metadata));
    if (auto restored = region.restoreTags(tags); !restored) {
        return std::unexpected("Invalid tag '" + restored.error().tag +
                               "': " + restored.error().message);
    }
    return region;
}

}  // namespace reaches::realm::model
