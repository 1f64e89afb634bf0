// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "tag_registry.hpp"

#include <algorithm>
#include <unordered_set>

#include "spdlog/spdlog.h"

#include "fuzzy_scorer.hpp"

namespace reaches::realm::tag {

namespace {

struct BiomePreset {
    std::string_view biome;
    std::vector<std::string_view> tags;
};

auto biomePresets() -> const std::vector<BiomePreset>& {
    static const std::vector<BiomePreset> presets = {
        {"forest",
         {"terrain:dense", "travel_speed:0.75", "resources:timber",
          "resources:game", "climate:temperate"}},
        {"desert",
         {"terrain:rocky", "travel_speed:0.5", "resources:minerals",
          "climate:arid"}},
        {"mountain",
         {"terrain:rugged", "travel_speed:0.25", "elevation:highland",
          "resources:stone", "resources:minerals"}},
        {"swamp",
         {"terrain:marshy", "travel_speed:0.5", "resources:herbs",
          "climate:humid"}},
        {"grassland",
         {"terrain:flat", "travel_speed:1.25", "resources:game",
          "climate:temperate"}},
    };
    return presets;
}

auto makeLabel(const TagNamespace& ns, std::string_view detail)
    -> std::string {
    std::string label(ns.name);
    label += ": ";
    label += detail;
    return label;
}

auto makeTag(std::string_view prefix, std::string_view value) -> std::string {
    std::string tag(prefix);
    tag += ':';
    tag += value;
    return tag;
}

void pushIfScored(std::vector<TagSuggestion>& out, std::string tag,
                  std::string label, const TagNamespace& ns, double score) {
    if (score > 0.0) {
        out.push_back(
            {std::move(tag), std::move(label), std::string(ns.name), score});
    }
}

}  // namespace

TagRegistry::TagRegistry(size_t maxSuggestions)
    : maxSuggestions_(maxSuggestions) {
    SPDLOG_DEBUG("TagRegistry created with {} namespaces, max {} suggestions",
                 builtinNamespaces().size(), maxSuggestions_);
}

auto TagRegistry::validate(std::string_view tag) const
    -> std::expected<void, TagError> {
    return validateTag(tag);
}

auto TagRegistry::isValid(std::string_view tag) const -> bool {
    return isValidTag(tag);
}

auto TagRegistry::namespaces() const -> std::span<const TagNamespace> {
    return builtinNamespaces();
}

auto TagRegistry::findNamespace(std::string_view prefix) const
    -> const TagNamespace* {
    return tag::findNamespace(prefix);
}

auto TagRegistry::namespaceOf(std::string_view tag) const
    -> const TagNamespace* {
    auto parts = splitTag(tag);
    if (!parts) {
        return nullptr;
    }
    return tag::findNamespace(parts->key);
}

auto TagRegistry::isSingleValued(std::string_view key) const -> bool {
    return isSingleValuedKey(key);
}

auto TagRegistry::suggestionsFor(std::string_view prefix) const
    -> std::vector<std::string> {
    std::vector<std::string> result;
    if (const auto* ns = tag::findNamespace(prefix)) {
        result.reserve(ns->suggestions.size());
        for (auto value : ns->suggestions) {
            result.push_back(makeTag(ns->prefix, value));
        }
    }
    return result;
}

auto TagRegistry::biomePreset(std::string_view biome) const
    -> std::vector<std::string> {
    const auto& presets = biomePresets();
    auto it = std::find_if(
        presets.begin(), presets.end(),
        [biome](const BiomePreset& preset) { return preset.biome == biome; });
    if (it == presets.end()) {
        return {};
    }
    return {it->tags.begin(), it->tags.end()};
}

auto TagRegistry::normalize(std::string_view tag) -> std::string {
    return normalizeTag(tag);
}

auto TagRegistry::suggest(std::string_view partial,
                          std::span<const std::string> existingTags) const
    -> std::vector<TagSuggestion> {
    std::vector<TagSuggestion> candidates;

    if (auto parts = splitTag(partial)) {
        auto fragment = parts->value.substr(0, parts->value.find(':'));
        const auto* ns = tag::findNamespace(parts->key);
        if (ns != nullptr) {
            for (auto value : ns->suggestions) {
                if (!containsIgnoreCase(value, fragment)) {
                    continue;
                }
                pushIfScored(candidates, makeTag(ns->prefix, value),
                             makeLabel(*ns, value), *ns,
                             relevanceScore(value, fragment));
            }
        }
    } else {
        std::unordered_set<std::string_view> presentKeys;
        for (const auto& existing : existingTags) {
            presentKeys.insert(tagKey(existing));
        }

        for (const auto& ns : builtinNamespaces()) {
            if (!ns.suggestWhenPresent && presentKeys.contains(ns.prefix)) {
                continue;
            }

            if (containsIgnoreCase(ns.prefix, partial)) {
                double score = relevanceScore(ns.prefix, partial);
                for (auto example : ns.examples) {
                    pushIfScored(candidates, std::string(example),
                                 makeLabel(ns, ns.description), ns, score);
                }
            }

            for (auto example : ns.examples) {
                auto exampleValue = splitTag(example)->value;
                if (containsIgnoreCase(exampleValue, partial)) {
                    pushIfScored(candidates, std::string(example),
                                 makeLabel(ns, exampleValue), ns,
                                 relevanceScore(exampleValue, partial));
                }
            }

            for (auto value : ns.suggestions) {
                if (containsIgnoreCase(value, partial)) {
                    pushIfScored(candidates, makeTag(ns.prefix, value),
                                 makeLabel(ns, value), ns,
                                 relevanceScore(value, partial));
                }
            }
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const TagSuggestion& a, const TagSuggestion& b) {
                         return a.score > b.score;
                     });

    // The same tag can be reached through several routes; keep the best
    std::vector<TagSuggestion> result;
    std::unordered_set<std::string> seen;
    for (auto& candidate : candidates) {
        if (result.size() >= maxSuggestions_) {
            break;
        }
        if (seen.insert(candidate.tag).second) {
            result.push_back(std::move(candidate));
        }
    }

    SPDLOG_DEBUG("Suggest '{}' produced {} of {} candidates", partial,
                 result.size(), candidates.size());
    return result;
}

auto TagRegistry::detectConflicts(std::span<const std::string> tags) const
    -> std::vector<std::string> {
    std::vector<std::string> conflicts;

    for (const auto& ns : builtinNamespaces()) {
        if (!ns.isSingleValued()) {
            continue;
        }
        std::vector<std::string_view> matching;
        for (const auto& tag : tags) {
            auto parts = splitTag(tag);
            if (parts && parts->key == ns.prefix) {
                matching.push_back(tag);
            }
        }
        if (matching.size() > 1) {
            std::string message = "Multiple ";
            message += ns.prefix;
            message += " tags found: ";
            for (size_t i = 0; i < matching.size(); ++i) {
                if (i > 0) {
                    message += ", ";
                }
                message += matching[i];
            }
            conflicts.push_back(std::move(message));
        }
    }

    double travelSpeed = 1.0;
    auto speedTag = std::find_if(tags.begin(), tags.end(),
                                 [](const std::string& tag) {
                                     return tag.starts_with("travel_speed:");
                                 });
    if (speedTag != tags.end()) {
        // Unparsable values never count as fast
        travelSpeed = parseNumber(splitTag(*speedTag)->value).value_or(0.0);
    }

    auto hasTag = [&tags](std::string_view wanted) {
        return std::find(tags.begin(), tags.end(), wanted) != tags.end();
    };
    if (travelSpeed > 1.0 &&
        (hasTag("terrain:dense") || hasTag("terrain:rocky"))) {
        conflicts.emplace_back(
            "High travel speed conflicts with dense/rocky terrain");
    }

    if (!conflicts.empty()) {
        spdlog::debug("Detected {} tag conflicts", conflicts.size());
    }
    return conflicts;
}

}  // namespace reaches::realm::tag
