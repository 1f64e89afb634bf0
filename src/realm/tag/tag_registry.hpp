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

#ifndef REACHES_REALM_TAG_TAG_REGISTRY_HPP
#define REACHES_REALM_TAG_TAG_REGISTRY_HPP

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "tag_namespace.hpp"
#include "tag_validator.hpp"

namespace reaches::realm::tag {

inline constexpr size_t DEFAULT_MAX_SUGGESTIONS = 10;

/**
 * @brief Ranked autocomplete candidate
 */
struct TagSuggestion {
    std::string tag;            ///< Fully-qualified tag to insert
    std::string label;          ///< Display text, "<Name>: <detail>"
    std::string namespaceName;  ///< Display name of the owning namespace
    double score = 0.0;         ///< Relevance in (0, 100]

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"tag", tag},
                {"label", label},
                {"namespace", namespaceName},
                {"score", score}};
    }
};

/**
 * @brief Tag vocabulary: validation, suggestions and conflict checks
 *
 * Stateless apart from the suggestion cap; the namespace table itself is
 * static and shared.
 *
 * Example usage:
 * @code
 * TagRegistry registry;
 * if (!registry.isValid("travel_speed:0.05")) { ... }
 * auto hints = registry.suggest("bio", {});
 * @endcode
 */
class TagRegistry {
public:
    explicit TagRegistry(size_t maxSuggestions = DEFAULT_MAX_SUGGESTIONS);

    // ==================== Validation ====================

    /**
     * @brief Validate a tag
     *
     * @param tag Tag text
     * @return Nothing on success, or the first rule the tag breaks
     */
    [[nodiscard]] auto validate(std::string_view tag) const
        -> std::expected<void, TagError>;

    [[nodiscard]] auto isValid(std::string_view tag) const -> bool;

    // ==================== Vocabulary ====================

    [[nodiscard]] auto namespaces() const -> std::span<const TagNamespace>;

    [[nodiscard]] auto findNamespace(std::string_view prefix) const
        -> const TagNamespace*;

    /**
     * @brief Namespace of a tag's key, nullptr for unknown keys
     */
    [[nodiscard]] auto namespaceOf(std::string_view tag) const
        -> const TagNamespace*;

    [[nodiscard]] auto isSingleValued(std::string_view key) const -> bool;

    /**
     * @brief Fully-qualified suggestion tags of a namespace
     *
     * @param prefix Namespace prefix
     * @return "prefix:value" for every suggestion value, empty if unknown
     */
    [[nodiscard]] auto suggestionsFor(std::string_view prefix) const
        -> std::vector<std::string>;

    /**
     * @brief Recommended companion tags for a biome value
     *
     * @param biome Biome value such as "forest" (without the prefix)
     * @return Companion tags, empty for biomes without a preset
     */
    [[nodiscard]] auto biomePreset(std::string_view biome) const
        -> std::vector<std::string>;

    [[nodiscard]] static auto normalize(std::string_view tag) -> std::string;

    // ==================== Suggestions ====================

    /**
     * @brief Ranked tag suggestions for partial input
     *
     * With a colon the text before it picks the namespace and the text
     * after it filters that namespace's values. Without a colon every
     * namespace is searched by prefix, example value and suggestion value;
     * namespaces already present in existingTags are skipped unless they
     * keep suggesting when present.
     *
     * @param partial Text typed so far
     * @param existingTags Tags the region already carries
     * @return At most maxSuggestions() entries, best first
     */
    [[nodiscard]] auto suggest(std::string_view partial,
                               std::span<const std::string> existingTags) const
        -> std::vector<TagSuggestion>;

    // ==================== Conflicts ====================

    /**
     * @brief Report inconsistencies in a tag set
     *
     * @param tags Tags to inspect
     * @return Warning messages, empty when consistent
     */
    [[nodiscard]] auto detectConflicts(std::span<const std::string> tags) const
        -> std::vector<std::string>;

    [[nodiscard]] auto maxSuggestions() const noexcept -> size_t {
        return maxSuggestions_;
    }

private:
    size_t maxSuggestions_;
};

}  // namespace reaches::realm::tag

#endif  // REACHES_REALM_TAG_TAG_REGISTRY_HPP
