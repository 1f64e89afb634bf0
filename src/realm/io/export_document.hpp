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

#ifndef REACHES_REALM_IO_EXPORT_DOCUMENT_HPP
#define REACHES_REALM_IO_EXPORT_DOCUMENT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "realm/model/region.hpp"

namespace reaches::realm::io {

/// Format tag identifying realm export documents
inline constexpr std::string_view FORMAT_TAG = "realms-and-reaches-v1";

/// Version written into document metadata
inline constexpr std::string_view DOCUMENT_VERSION = "1.0.0";

/// Name given to imported records that carry none
inline constexpr std::string_view IMPORTED_REGION_NAME = "Imported Realm";

/// Plane extent used by scene bundles when none is configured
inline constexpr double DEFAULT_PLANE_EXTENT = 4000.0;

/**
 * @brief How an import reconciles incoming ids with the store
 */
enum class ImportPolicy {
    /// Keep existing regions, drop incoming ones whose id is taken
    Skip = 0,

    /// Keep existing regions, re-key incoming ones whose id is taken
    Merge = 1,

    /// Empty the store, then insert everything
    Replace = 2
};

[[nodiscard]] auto importPolicyToString(ImportPolicy policy) -> std::string;

[[nodiscard]] auto importPolicyFromString(std::string_view name)
    -> std::optional<ImportPolicy>;

/**
 * @brief Header of an export document
 */
struct DocumentMetadata {
    std::string author;
    std::string created;  ///< ISO-8601 UTC
    std::string version{DOCUMENT_VERSION};
    std::optional<std::string> description;
    std::string scope;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> DocumentMetadata;
};

/**
 * @brief Width and height of the annotated plane
 */
struct PlaneBounds {
    double width = DEFAULT_PLANE_EXTENT;
    double height = DEFAULT_PLANE_EXTENT;

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"width", width}, {"height", height}};
    }
};

/**
 * @brief Snapshot of a whole store
 */
struct ExportDocument {
    std::string format{FORMAT_TAG};
    DocumentMetadata metadata;
    std::vector<model::Region> regions;
    std::optional<PlaneBounds> bounds;
};

/**
 * @brief Options for exportStore / exportScene
 */
struct ExportOptions {
    /// Defaults to the store's configured author
    std::optional<std::string> author;
    std::optional<std::string> description;
};

/**
 * @brief Statistics for one import call
 */
struct ImportResult {
    int totalRecords = 0;   ///< Records found in the document
    int importedCount = 0;  ///< Regions stored
    int skippedCount = 0;   ///< Records dropped because their id was taken
    int errorCount = 0;     ///< Malformed records
    std::vector<std::string> errors;       ///< Detailed error messages
    std::vector<std::string> importedIds;  ///< Ids as stored

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"totalRecords", totalRecords},
                {"importedCount", importedCount},
                {"skippedCount", skippedCount},
                {"errorCount", errorCount},
                {"errors", errors},
                {"importedIds", importedIds}};
    }
};

}  // namespace reaches::realm::io

#endif  // REACHES_REALM_IO_EXPORT_DOCUMENT_HPP
