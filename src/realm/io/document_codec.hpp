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

#ifndef REACHES_REALM_IO_DOCUMENT_CODEC_HPP
#define REACHES_REALM_IO_DOCUMENT_CODEC_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "export_document.hpp"

#include "realm/core/error.hpp"
#include "realm/store/region_store.hpp"

namespace reaches::realm::io {

/**
 * @brief Export and import of whole-store snapshots
 *
 * Documents are plain JSON values; reading and writing them to files or
 * databases is left to the host.
 *
 * Document layout:
 * @code
 * {
 *   "format": "realms-and-reaches-v1",
 *   "metadata": {"author", "created", "version", "description", "scope"},
 *   "regions": [{"id", "name", "geometry", "tags", "metadata"}, ...],
 *   "bounds": {"width", "height"}
 * }
 * @endcode
 */
class DocumentCodec {
public:
    DocumentCodec();
    ~DocumentCodec();

    // ==================== Export ====================

    /**
     * @brief Snapshot every region of a store
     *
     * @param store Source store
     * @param options Author and description overrides
     * @return Document with regions in insertion order
     */
    [[nodiscard]] auto exportStore(const store::RegionStore& store,
                                   const ExportOptions& options = {}) const
        -> ExportDocument;

    /**
     * @brief Scene bundle keyed by the store's scope
     *
     * Layout: {format, metadata, scenes: {<scope>: {regions, bounds}}}.
     */
    [[nodiscard]] auto exportScene(const store::RegionStore& store,
                                   const ExportOptions& options = {}) const
        -> nlohmann::json;

    // ==================== Conversion ====================

    [[nodiscard]] static auto toJson(const ExportDocument& document)
        -> nlohmann::json;

    /**
     * @brief Strictly decode a document
     *
     * Unlike importStore(), a single malformed record fails the whole
     * conversion.
     *
     * @return Document, or UnsupportedFormat / MalformedDocument /
     *         MalformedRecord
     */
    [[nodiscard]] static auto documentFromJson(const nlohmann::json& j)
        -> std::expected<ExportDocument, RealmError>;

    /**
     * @brief Serialize to JSON text
     *
     * @param indent Spaces per level, negative for compact output
     */
    [[nodiscard]] static auto serialize(const ExportDocument& document,
                                        int indent = 2) -> std::string;

    /**
     * @brief Parse JSON text
     *
     * @return JSON value, or MalformedDocument on syntax errors
     */
    [[nodiscard]] static auto parse(std::string_view text)
        -> std::expected<nlohmann::json, RealmError>;

    // ==================== Import ====================

    /**
     * @brief Import an export document into a store
     *
     * The format tag and document shape are checked before the store is
     * touched. Malformed records are logged, counted and skipped. Tags
     * are stored as authored.
     *
     * @param store Target store
     * @param document Export document JSON
     * @param policy Id conflict policy
     * @return Import statistics, or UnsupportedFormat / MalformedDocument
     */
    auto importStore(store::RegionStore& store,
                     const nlohmann::json& document,
                     ImportPolicy policy = ImportPolicy::Skip) const
        -> std::expected<ImportResult, RealmError>;

    /**
     * @brief Import an already decoded document
     */
    auto importStore(store::RegionStore& store,
                     const ExportDocument& document,
                     ImportPolicy policy = ImportPolicy::Skip) const
        -> std::expected<ImportResult, RealmError>;

    /**
     * @brief Import a scene bundle
     *
     * Reads the section named after the store's scope, or the first
     * section when there is none. Every region gets a fresh id.
     */
    auto importScene(store::RegionStore& store,
                     const nlohmann::json& bundle) const
        -> std::expected<ImportResult, RealmError>;

private:
    /**
     * @brief Decode region records, collecting per-record errors
     */
    [[nodiscard]] auto decodeRecords(const store::RegionStore& store,
                                     const nlohmann::json& records,
                                     ImportResult& result) const
        -> std::vector<model::Region>;

    void applyImport(store::RegionStore& store,
                     std::vector<model::Region> regions, ImportPolicy policy,
                     ImportResult& result) const;

    static void recordError(ImportResult& result, std::string message);

    [[nodiscard]] static auto checkFormat(const nlohmann::json& document)
        -> std::expected<void, RealmError>;
};

}  // namespace reaches::realm::io

#endif  // REACHES_REALM_IO_DOCUMENT_CODEC_HPP
