// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_STORE_STORE_EVENT_HPP
#define REACHES_REALM_STORE_STORE_EVENT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace reaches::realm::store {

/**
 * @brief Kind of store mutation
 */
enum class StoreEventType {
    Created = 0,
    Updated = 1,
    Deleted = 2,
    Imported = 3,  ///< Bulk import finished; count holds regions imported
    Cleared = 4    ///< Store emptied; count holds regions removed
};

[[nodiscard]] inline auto storeEventTypeToString(StoreEventType type)
    -> std::string {
    switch (type) {
        case StoreEventType::Created:
            return "realmCreated";
        case StoreEventType::Updated:
            return "realmUpdated";
        case StoreEventType::Deleted:
            return "realmDeleted";
        case StoreEventType::Imported:
            return "realmsImported";
        case StoreEventType::Cleared:
            return "realmsCleared";
        default:
            return "unknown";
    }
}

/**
 * @brief Change notification delivered to store listeners
 */
struct StoreEvent {
    StoreEventType type = StoreEventType::Created;
    std::string regionId;  ///< Empty for bulk events
    std::string scope;
    size_t count = 0;
};

using StoreListener = std::function<void(const StoreEvent&)>;
using ListenerId = std::uint64_t;

/**
 * @brief Summary of store contents
 */
struct StoreStatistics {
    size_t totalRegions = 0;

    /// Number of tags per key across all regions
    std::map<std::string, size_t> tagCounts;

    std::string scope;

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"totalRealms", totalRegions},
                {"tagCounts", tagCounts},
                {"sceneId", scope}};
    }
};

}  // namespace reaches::realm::store

#endif  // REACHES_REALM_STORE_STORE_EVENT_HPP
