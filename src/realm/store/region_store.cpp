// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "region_store.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "realm/tag/tag_validator.hpp"

namespace reaches::realm::store {

namespace {

auto makeIdGenerator(size_t length, std::optional<std::uint64_t> seed)
    -> IdGenerator {
    if (seed) {
        return IdGenerator(length, *seed);
    }
    return IdGenerator(length);
}

auto invalidTag(const tag::TagError& error) -> RealmError {
    return {RealmErrorCode::InvalidTag,
            "Invalid tag '" + error.tag + "': " + error.message, error.tag};
}

auto firstInvalid(std::span<const std::string> tags)
    -> std::optional<tag::TagError> {
    for (const auto& candidate : tags) {
        if (auto valid = tag::validateTag(candidate); !valid) {
            return valid.error();
        }
    }
    return std::nullopt;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

RegionStore::RegionStore(StoreOptions options)
    : config_(std::move(options.config)),
      clock_(std::move(options.clock)),
      idGenerator_(makeIdGenerator(config_.idLength, options.idSeed)) {
    if (auto problem = config_.validate(); !problem.empty()) {
        spdlog::error("Rejected store config: {}", problem);
        throw std::invalid_argument("Invalid store config: " + problem);
    }
    if (auto bad = firstInvalid(config_.defaultTags)) {
        spdlog::error("Rejected default tag '{}': {}", bad->tag, bad->message);
        throw std::invalid_argument("Invalid default tag '" + bad->tag +
                                    "': " + bad->message);
    }
    if (!clock_) {
        clock_ = model::currentTimestamp;
    }

    spdlog::info("RegionStore created for scope '{}'", config_.scope);
}

// ============================================================================
// Mutations
// ============================================================================

auto RegionStore::create(const model::CreateRequest& request)
    -> std::expected<model::Region, RealmError> {
    if (auto bad = firstInvalid(request.tags)) {
        SPDLOG_DEBUG("Create rejected: {}", bad->message);
        return std::unexpected(invalidTag(*bad));
    }

    auto timestamp = now();
    model::RegionMetadata metadata;
    metadata.created = timestamp;
    metadata.modified = timestamp;
    metadata.author = request.author.value_or(config_.defaultAuthor);

    model::Region region(generateId(), request.name, request.geometry,
                         std::move(metadata));
    if (auto added = region.addTags(config_.defaultTags); !added) {
        return std::unexpected(invalidTag(added.error()));
    }
    if (auto added = region.addTags(request.tags); !added) {
        return std::unexpected(invalidTag(added.error()));
    }

    const std::string id = region.id();
    index_.insert(id, region.bounds(), geometry::footprint(region.geometry()));
    auto it = byId_.emplace(id, std::move(region)).first;

    SPDLOG_DEBUG("Region created: {} ({})", it->second.name(), it->first);
    publish({StoreEventType::Created, it->first, config_.scope, 1});
    return it->second;
}

auto RegionStore::update(const std::string& id,
                         const model::RegionPatch& patch)
    -> std::expected<model::Region, RealmError> {
    auto it = byId_.find(id);
    if (it == byId_.end()) {
        return std::unexpected(
            RealmError{RealmErrorCode::NotFound, "Region not found", id});
    }

    if (patch.tags) {
        if (auto bad = firstInvalid(*patch.tags)) {
            return std::unexpected(invalidTag(*bad));
        }
    }
    if (auto bad = firstInvalid(patch.addTags)) {
        return std::unexpected(invalidTag(*bad));
    }

    // Work on a copy so a failure leaves the stored region untouched
    model::Region updated = it->second;
    if (patch.name) {
        updated.setName(*patch.name);
    }
    if (patch.geometry) {
        updated.setGeometry(*patch.geometry);
    }
    if (patch.tags) {
        if (auto replaced = updated.setTags(*patch.tags); !replaced) {
            return std::unexpected(invalidTag(replaced.error()));
        }
    }
    for (const auto& removed : patch.removeTags) {
        updated.removeTag(removed);
    }
    if (auto added = updated.addTags(patch.addTags); !added) {
        return std::unexpected(invalidTag(added.error()));
    }
    updated.touch(now());

    it->second = std::move(updated);
    index_.insert(id, it->second.bounds(),
                  geometry::footprint(it->second.geometry()));

    SPDLOG_DEBUG("Region updated: {}", id);
    publish({StoreEventType::Updated, id, config_.scope, 1});
    return it->second;
}

auto RegionStore::remove(const std::string& id) -> bool {
    auto it = byId_.find(id);
    if (it == byId_.end()) {
        return false;
    }

    byId_.erase(it);
    index_.remove(id);

    SPDLOG_DEBUG("Region deleted: {}", id);
    publish({StoreEventType::Deleted, id, config_.scope, 1});
    return true;
}

auto RegionStore::insert(model::Region region)
    -> std::expected<void, RealmError> {
    const std::string id = region.id();
    if (id.empty()) {
        return std::unexpected(RealmError{RealmErrorCode::MalformedRecord,
                                          "Region id must not be empty"});
    }
    if (byId_.contains(id)) {
        return std::unexpected(
            RealmError{RealmErrorCode::DuplicateId, "Duplicate region id", id});
    }

    index_.insert(id, region.bounds(), geometry::footprint(region.geometry()));
    byId_.emplace(id, std::move(region));
    issuedIds_.insert(id);

    SPDLOG_DEBUG("Region inserted verbatim: {}", id);
    publish({StoreEventType::Created, id, config_.scope, 1});
    return {};
}

auto RegionStore::clear() -> size_t {
    size_t removed = byId_.size();
    byId_.clear();
    index_.clear();

    spdlog::info("Cleared {} regions from scope '{}'", removed,
                 config_.scope);
    publish({StoreEventType::Cleared, {}, config_.scope, removed});
    return removed;
}

// ============================================================================
// Lookups
// ============================================================================

auto RegionStore::get(const std::string& id) const
    -> std::optional<model::Region> {
    auto it = byId_.find(id);
    if (it == byId_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto RegionStore::contains(const std::string& id) const -> bool {
    return byId_.contains(id);
}

auto RegionStore::all() const -> std::vector<model::Region> {
    return collect(index_.ids());
}

auto RegionStore::collect(const std::vector<std::string>& ids) const
    -> std::vector<model::Region> {
    std::vector<model::Region> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto it = byId_.find(id); it != byId_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

auto RegionStore::queryPoint(double x, double y) const
    -> std::vector<model::Region> {
    std::vector<model::Region> result;
    for (const auto& id : index_.candidatesAt(x, y)) {
        const auto& region = byId_.at(id);
        if (region.containsPoint(x, y)) {
            result.push_back(region);
        }
    }
    SPDLOG_DEBUG("Point query ({}, {}) matched {} regions", x, y,
                 result.size());
    return result;
}

auto RegionStore::queryBounds(const geometry::BoundingBox& box) const
    -> std::vector<model::Region> {
    return collect(index_.searchBox(box));
}

auto RegionStore::hasAllTags(const model::Region& region,
                             std::span<const std::string> required) -> bool {
    const auto& tags = region.rawTags();
    return std::all_of(required.begin(), required.end(),
                       [&tags](const std::string& wanted) {
                           return std::find(tags.begin(), tags.end(),
                                            wanted) != tags.end();
                       });
}

auto RegionStore::queryTags(std::span<const std::string> required) const
    -> std::vector<model::Region> {
    std::vector<model::Region> result;
    for (const auto& id : index_.ids()) {
        const auto& region = byId_.at(id);
        if (hasAllTags(region, required)) {
            result.push_back(region);
        }
    }
    return result;
}

auto RegionStore::findByTag(std::string_view tag) const
    -> std::vector<model::Region> {
    const std::string wanted(tag);
    return queryTags(std::span<const std::string>(&wanted, 1));
}

auto RegionStore::findByTagKey(std::string_view key) const
    -> std::vector<model::Region> {
    std::vector<model::Region> result;
    for (const auto& id : index_.ids()) {
        const auto& region = byId_.at(id);
        if (!region.tagsWithPrefix(key).empty()) {
            result.push_back(region);
        }
    }
    return result;
}

auto RegionStore::find(const model::RegionQuery& query) const
    -> std::vector<model::Region> {
    std::vector<model::Region> result;
    for (const auto& id : index_.ids()) {
        if (query.limit > 0 && result.size() >= query.limit) {
            break;
        }

        const auto& region = byId_.at(id);
        if (query.tags && !hasAllTags(region, *query.tags)) {
            continue;
        }
        if (query.bounds && !geometry::intersects(*index_.boundsOf(id),
                                                  *query.bounds)) {
            continue;
        }
        if (query.point) {
            auto [x, y] = *query.point;
            if (!index_.reachOf(id)->contains(x, y) ||
                !region.containsPoint(x, y)) {
                continue;
            }
        }
        result.push_back(region);
    }
    return result;
}

auto RegionStore::regionAt(double x, double y) const
    -> std::optional<model::Region> {
    for (const auto& id : index_.candidatesAt(x, y)) {
        const auto& region = byId_.at(id);
        if (region.containsPoint(x, y)) {
            return region;
        }
    }
    return std::nullopt;
}

auto RegionStore::statistics() const -> StoreStatistics {
    StoreStatistics stats;
    stats.totalRegions = byId_.size();
    stats.scope = config_.scope;
    for (const auto& [id, region] : byId_) {
        for (const auto& existing : region.rawTags()) {
            ++stats.tagCounts[std::string(tag::tagKey(existing))];
        }
    }
    return stats;
}

// ============================================================================
// Listeners
// ============================================================================

auto RegionStore::addListener(StoreListener listener) -> ListenerId {
    ListenerId id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

auto RegionStore::removeListener(ListenerId id) -> bool {
    auto removed = std::erase_if(
        listeners_, [id](const auto& entry) { return entry.first == id; });
    return removed > 0;
}

void RegionStore::notifyImported(size_t count) const {
    publish({StoreEventType::Imported, {}, config_.scope, count});
}

void RegionStore::publish(const StoreEvent& event) const {
    // Copy so listeners may add or remove listeners while being notified
    auto snapshot = listeners_;
    for (const auto& [id, listener] : snapshot) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            spdlog::warn("Store listener {} failed on {}: {}", id,
                         storeEventTypeToString(event.type), ex.what());
        }
    }
}

// ============================================================================
// Accessors
// ============================================================================

auto RegionStore::generateId() -> std::string {
    std::string id;
    do {
        id = idGenerator_.next();
    } while (byId_.contains(id) || issuedIds_.contains(id));
    issuedIds_.insert(id);
    return id;
}

auto RegionStore::now() const -> model::Timestamp {
    return clock_();
}

}  // namespace reaches::realm::store
