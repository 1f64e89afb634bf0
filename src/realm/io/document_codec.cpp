// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "document_codec.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace reaches::realm::io {

namespace {

auto hasUsableName(const nlohmann::json& record) -> bool {
    return record.contains("name") && record["name"].is_string() &&
           !record["name"].get_ref<const std::string&>().empty();
}

/**
 * Decode one region record, naming unnamed records as imported.
 */
auto decodeRecord(const nlohmann::json& record,
                  const model::RegionMetadata& fallback)
    -> std::expected<model::Region, std::string> {
    auto region = model::Region::fromJson(record, fallback);
    if (region && !hasUsableName(record)) {
        region->setName(std::string(IMPORTED_REGION_NAME));
    }
    return region;
}

auto planeBounds(const EngineConfig& config) -> std::optional<PlaneBounds> {
    if (config.planeWidth && config.planeHeight) {
        return PlaneBounds{*config.planeWidth, *config.planeHeight};
    }
    return std::nullopt;
}

auto regionsToJson(const std::vector<model::Region>& regions)
    -> nlohmann::json {
    auto array = nlohmann::json::array();
    for (const auto& region : regions) {
        array.push_back(region.toJson());
    }
    return array;
}

}  // namespace

DocumentCodec::DocumentCodec() { SPDLOG_DEBUG("DocumentCodec initialized"); }

DocumentCodec::~DocumentCodec() = default;

// ============================================================================
// Export
// ============================================================================

auto DocumentCodec::exportStore(const store::RegionStore& store,
                                const ExportOptions& options) const
    -> ExportDocument {
    ExportDocument document;
    document.metadata.author = options.author.value_or(store.defaultAuthor());
    document.metadata.created = model::formatIsoTimestamp(store.now());
    document.metadata.description = options.description;
    document.metadata.scope = store.scope();
    document.regions = store.all();
    document.bounds = planeBounds(store.config());

    spdlog::info("Exported {} regions from scope '{}'",
                 document.regions.size(), store.scope());
    return document;
}

auto DocumentCodec::exportScene(const store::RegionStore& store,
                                const ExportOptions& options) const
    -> nlohmann::json {
    DocumentMetadata metadata;
    metadata.author = options.author.value_or(store.defaultAuthor());
    metadata.created = model::formatIsoTimestamp(store.now());
    metadata.description = options.description.value_or(
        "Realm data for scene " + store.scope());
    metadata.scope = store.scope();

    auto bounds = planeBounds(store.config()).value_or(PlaneBounds{});
    auto regions = store.all();

    nlohmann::json scenes = nlohmann::json::object();
    scenes[store.scope()] = {{"regions", regionsToJson(regions)},
                             {"bounds", bounds.toJson()}};

    spdlog::info("Exported scene '{}' with {} regions", store.scope(),
                 regions.size());
    return {{"format", FORMAT_TAG},
            {"metadata", metadata.toJson()},
            {"scenes", std::move(scenes)}};
}

// ============================================================================
// Conversion
// ============================================================================

auto DocumentCodec::toJson(const ExportDocument& document) -> nlohmann::json {
    nlohmann::json j = {{"format", document.format},
                        {"metadata", document.metadata.toJson()},
                        {"regions", regionsToJson(document.regions)}};
    if (document.bounds) {
        j["bounds"] = document.bounds->toJson();
    }
    return j;
}

auto DocumentCodec::checkFormat(const nlohmann::json& document)
    -> std::expected<void, RealmError> {
    if (!document.is_object()) {
        return std::unexpected(RealmError{RealmErrorCode::MalformedDocument,
                                          "Document must be a JSON object"});
    }
    if (!document.contains("format") || !document["format"].is_string()) {
        return std::unexpected(RealmError{RealmErrorCode::UnsupportedFormat,
                                          "Document has no format tag"});
    }
    const auto& format = document["format"].get_ref<const std::string&>();
    if (format != FORMAT_TAG) {
        return std::unexpected(RealmError{RealmErrorCode::UnsupportedFormat,
                                          "Unsupported document format",
                                          format});
    }
    return {};
}

auto DocumentCodec::documentFromJson(const nlohmann::json& j)
    -> std::expected<ExportDocument, RealmError> {
    if (auto checked = checkFormat(j); !checked) {
        return std::unexpected(checked.error());
    }
    if (!j.contains("regions") || !j["regions"].is_array()) {
        return std::unexpected(RealmError{RealmErrorCode::MalformedDocument,
                                          "Document has no regions array"});
    }

    try {
        ExportDocument document;
        document.format = j["format"].get<std::string>();
        if (j.contains("metadata")) {
            document.metadata = DocumentMetadata::fromJson(j["metadata"]);
        }

        model::RegionMetadata fallback;
        fallback.created = model::currentTimestamp();
        fallback.modified = fallback.created;

        size_t index = 0;
        for (const auto& record : j["regions"]) {
            auto region = decodeRecord(record, fallback);
            if (!region) {
                return std::unexpected(
                    RealmError{RealmErrorCode::MalformedRecord,
                               "Record " + std::to_string(index) + ": " +
                                   region.error()});
            }
            document.regions.push_back(std::move(*region));
            ++index;
        }

        if (j.contains("bounds") && j["bounds"].is_object()) {
            PlaneBounds bounds;
            bounds.width = j["bounds"].value("width", DEFAULT_PLANE_EXTENT);
            bounds.height = j["bounds"].value("height", DEFAULT_PLANE_EXTENT);
            document.bounds = bounds;
        }
        return document;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(RealmError{
            RealmErrorCode::MalformedDocument,
            std::string("Invalid document field: ") + ex.what()});
    }
}

auto DocumentCodec::serialize(const ExportDocument& document, int indent)
    -> std::string {
    return toJson(document).dump(indent);
}

auto DocumentCodec::parse(std::string_view text)
    -> std::expected<nlohmann::json, RealmError> {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            RealmError{RealmErrorCode::MalformedDocument,
                       std::string("JSON parse error: ") + ex.what()});
    }
}

// ============================================================================
// Import
// ============================================================================

void DocumentCodec::recordError(ImportResult& result, std::string message) {
    spdlog::warn("Skipping import record: {}", message);
    result.errorCount++;
    result.errors.push_back(std::move(message));
}

auto DocumentCodec::decodeRecords(const store::RegionStore& store,
                                  const nlohmann::json& records,
                                  ImportResult& result) const
    -> std::vector<model::Region> {
    model::RegionMetadata fallback;
    fallback.created = store.now();
    fallback.modified = fallback.created;
    fallback.author = store.defaultAuthor();

    std::vector<model::Region> regions;
    regions.reserve(records.size());

    int index = 0;
    for (const auto& record : records) {
        result.totalRecords++;
        try {
            auto region = decodeRecord(record, fallback);
            if (region) {
                regions.push_back(std::move(*region));
            } else {
                recordError(result, "Record " + std::to_string(index) + ": " +
                                        region.error());
            }
        } catch (const nlohmann::json::exception& ex) {
            recordError(result, "Record " + std::to_string(index) + ": " +
                                    ex.what());
        }
        ++index;
    }
    return regions;
}

void DocumentCodec::applyImport(store::RegionStore& store,
                                std::vector<model::Region> regions,
                                ImportPolicy policy,
                                ImportResult& result) const {
    if (policy == ImportPolicy::Replace) {
        store.clear();
    }

    for (auto& region : regions) {
        if (store.contains(region.id())) {
            if (policy == ImportPolicy::Skip) {
                SPDLOG_DEBUG("Skipping existing region {}", region.id());
                result.skippedCount++;
                continue;
            }
            if (policy == ImportPolicy::Merge) {
                auto freshId = store.generateId();
                SPDLOG_DEBUG("Re-keying region {} as {}", region.id(),
                             freshId);
                region = region.withId(std::move(freshId));
            }
        }

        std::string id = region.id();
        if (auto inserted = store.insert(std::move(region)); !inserted) {
            recordError(result, inserted.error().toString());
            continue;
        }
        result.importedCount++;
        result.importedIds.push_back(std::move(id));
    }

    spdlog::info(
        "Imported {} of {} regions into scope '{}' (policy {}, {} skipped, "
        "{} errors)",
        result.importedCount, result.totalRecords, store.scope(),
        importPolicyToString(policy), result.skippedCount, result.errorCount);

    store.notifyImported(static_cast<size_t>(result.importedCount));
}

auto DocumentCodec::importStore(store::RegionStore& store,
                                const nlohmann::json& document,
                                ImportPolicy policy) const
    -> std::expected<ImportResult, RealmError> {
    if (auto checked = checkFormat(document); !checked) {
        spdlog::error("Import rejected: {}", checked.error().toString());
        return std::unexpected(checked.error());
    }
    if (!document.contains("regions") || !document["regions"].is_array()) {
        RealmError error{RealmErrorCode::MalformedDocument,
                         "Document has no regions array"};
        spdlog::error("Import rejected: {}", error.toString());
        return std::unexpected(std::move(error));
    }

    ImportResult result;
    auto regions = decodeRecords(store, document["regions"], result);
    applyImport(store, std::move(regions), policy, result);
    return result;
}

auto DocumentCodec::importStore(store::RegionStore& store,
                                const ExportDocument& document,
                                ImportPolicy policy) const
    -> std::expected<ImportResult, RealmError> {
    if (document.format != FORMAT_TAG) {
        return std::unexpected(RealmError{RealmErrorCode::UnsupportedFormat,
                                          "Unsupported document format",
                                          document.format});
    }

    ImportResult result;
    result.totalRecords = static_cast<int>(document.regions.size());
    applyImport(store, document.regions, policy, result);
    return result;
}

auto DocumentCodec::importScene(store::RegionStore& store,
                                const nlohmann::json& bundle) const
    -> std::expected<ImportResult, RealmError> {
    if (auto checked = checkFormat(bundle); !checked) {
        spdlog::error("Scene import rejected: {}", checked.error().toString());
        return std::unexpected(checked.error());
    }
    if (!bundle.contains("scenes") || !bundle["scenes"].is_object() ||
        bundle["scenes"].empty()) {
        return std::unexpected(RealmError{RealmErrorCode::MalformedDocument,
                                          "Bundle has no scenes"});
    }

    const auto& scenes = bundle["scenes"];
    auto section = scenes.find(store.scope());
    if (section == scenes.end()) {
        section = scenes.begin();
    }
    if (!section->is_object() || !section->contains("regions") ||
        !(*section)["regions"].is_array()) {
        return std::unexpected(RealmError{RealmErrorCode::MalformedDocument,
                                          "Scene section has no regions array",
                                          section.key()});
    }

    ImportResult result;
    auto regions = decodeRecords(store, (*section)["regions"], result);
    for (auto& region : regions) {
        region = region.withId(store.generateId());
    }

    SPDLOG_DEBUG("Importing scene section '{}' into scope '{}'",
                 section.key(), store.scope());
    applyImport(store, std::move(regions), ImportPolicy::Merge, result);
    return result;
}

}  // namespace reaches::realm::io
