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

#ifndef REACHES_REALM_CORE_ENGINE_CONFIG_HPP
#define REACHES_REALM_CORE_ENGINE_CONFIG_HPP

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging.hpp"

namespace reaches::realm {

/**
 * @brief Engine configuration for one realm scope
 *
 * Defines defaults applied to new regions and limits used by queries.
 *
 * Usage:
 * @code
 * auto config = parseEngineConfig(R"({"scope": "scene-1"})");
 * if (config) {
 *     RealmEngine engine(*config);
 * }
 * @endcode
 */
struct EngineConfig {
    /// Scope identifier the store belongs to (scene, document, ...)
    std::string scope = "global";

    /// Author recorded in metadata when the caller supplies none
    std::string defaultAuthor = "Unknown";

    /// Tags applied to every newly created region
    std::vector<std::string> defaultTags;

    /// Length of generated region ids
    size_t idLength = 16;

    /// Maximum number of tag suggestions returned per call
    size_t maxSuggestions = 10;

    /// Plane extent written into exports, if known
    std::optional<double> planeWidth;
    std::optional<double> planeHeight;

    LoggingConfig logging;

    /**
     * @brief Check configuration consistency
     *
     * @return Empty string if valid, otherwise the first problem found
     */
    [[nodiscard]] auto validate() const -> std::string;

    [[nodiscard]] auto isValid() const -> bool { return validate().empty(); }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Build config from JSON, keeping defaults for missing keys
     *
     * @throws nlohmann::json::exception on type mismatches
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> EngineConfig;

    /**
     * @brief Defaults used by the map annotator front end
     *
     * New regions start tagged `biome:unknown`.
     */
    [[nodiscard]] static auto withAnnotatorDefaults() -> EngineConfig;
};

/**
 * @brief Parse and validate engine configuration text
 *
 * @param text JSON text
 * @return Config, or error string describing the parse/validation failure
 */
[[nodiscard]] auto parseEngineConfig(std::string_view text)
    -> std::expected<EngineConfig, std::string>;

}  // namespace reaches::realm

#endif  // REACHES_REALM_CORE_ENGINE_CONFIG_HPP
