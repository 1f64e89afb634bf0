// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "engine_config.hpp"

#include <spdlog/spdlog.h>

namespace reaches::realm {

namespace {
constexpr size_t MIN_ID_LENGTH = 8;
constexpr size_t MAX_ID_LENGTH = 64;
}  // namespace

auto EngineConfig::validate() const -> std::string {
    if (scope.empty()) {
        return "scope must not be empty";
    }
    if (idLength < MIN_ID_LENGTH || idLength > MAX_ID_LENGTH) {
        return "idLength must be between " + std::to_string(MIN_ID_LENGTH) +
               " and " + std::to_string(MAX_ID_LENGTH);
    }
    if (maxSuggestions == 0) {
        return "maxSuggestions must be at least 1";
    }
    if ((planeWidth && *planeWidth < 0.0) ||
        (planeHeight && *planeHeight < 0.0)) {
        return "plane extent must not be negative";
    }
    return {};
}

auto EngineConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"scope", scope},
                        {"defaultAuthor", defaultAuthor},
                        {"defaultTags", defaultTags},
                        {"idLength", idLength},
                        {"maxSuggestions", maxSuggestions},
                        {"logging", logging.toJson()}};
    if (planeWidth) {
        j["planeWidth"] = *planeWidth;
    }
    if (planeHeight) {
        j["planeHeight"] = *planeHeight;
    }
    return j;
}

auto EngineConfig::fromJson(const nlohmann::json& j) -> EngineConfig {
    EngineConfig config;
    config.scope = j.value("scope", config.scope);
    config.defaultAuthor = j.value("defaultAuthor", config.defaultAuthor);
    config.defaultTags =
        j.value("defaultTags", std::vector<std::string>{});
    config.idLength = j.value("idLength", config.idLength);
    config.maxSuggestions = j.value("maxSuggestions", config.maxSuggestions);
    if (j.contains("planeWidth") && j["planeWidth"].is_number()) {
        config.planeWidth = j["planeWidth"].get<double>();
    }
    if (j.contains("planeHeight") && j["planeHeight"].is_number()) {
        config.planeHeight = j["planeHeight"].get<double>();
    }
    if (j.contains("logging") && j["logging"].is_object()) {
        config.logging = LoggingConfig::fromJson(j["logging"]);
    }
    return config;
}

auto EngineConfig::withAnnotatorDefaults() -> EngineConfig {
    EngineConfig config;
    config.defaultTags = {"biome:unknown"};
    config.planeWidth = 4000.0;
    config.planeHeight = 4000.0;
    return config;
}

auto parseEngineConfig(std::string_view text)
    -> std::expected<EngineConfig, std::string> {
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return std::unexpected("Engine config must be a JSON object");
        }

        auto config = EngineConfig::fromJson(j);
        if (auto problem = config.validate(); !problem.empty()) {
            spdlog::error("Rejected engine config: {}", problem);
            return std::unexpected("Invalid engine config: " + problem);
        }
        return config;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(std::string("JSON parse error: ") + ex.what());
    }
}

}  // namespace reaches::realm
