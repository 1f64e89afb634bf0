// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "export_document.hpp"

namespace reaches::realm::io {

auto importPolicyToString(ImportPolicy policy) -> std::string {
    switch (policy) {
        case ImportPolicy::Skip:
            return "skip";
        case ImportPolicy::Merge:
            return "merge";
        case ImportPolicy::Replace:
            return "replace";
        default:
            return "unknown";
    }
}

auto importPolicyFromString(std::string_view name)
    -> std::optional<ImportPolicy> {
    if (name == "skip") {
        return ImportPolicy::Skip;
    }
    if (name == "merge") {
        return ImportPolicy::Merge;
    }
    if (name == "replace") {
        return ImportPolicy::Replace;
    }
    return std::nullopt;
}

auto DocumentMetadata::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"author", author},
                        {"created", created},
                        {"version", version},
                        {"scope", scope}};
    if (description) {
        j["description"] = *description;
    }
    return j;
}

auto DocumentMetadata::fromJson(const nlohmann::json& j) -> DocumentMetadata {
    DocumentMetadata metadata;
    if (!j.is_object()) {
        return metadata;
    }
    metadata.author = j.value("author", "");
    metadata.created = j.value("created", "");
    metadata.version = j.value("version", std::string(DOCUMENT_VERSION));
    metadata.scope = j.value("scope", "");
    if (j.contains("description") && j["description"].is_string()) {
        metadata.description = j["description"].get<std::string>();
    }
    return metadata;
}

}  // namespace reaches::realm::io
