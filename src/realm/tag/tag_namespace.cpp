// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "tag_namespace.hpp"

#include <algorithm>

namespace reaches::realm::tag {

namespace {

auto makeNamespaces() -> std::vector<TagNamespace> {
    std::vector<TagNamespace> table;

    table.push_back(
        {"biome",
         "Biome",
         "Primary ecosystem type",
         "#28a745",
         {"biome:forest", "biome:desert", "biome:mountain", "biome:swamp"},
         {"forest", "desert", "mountain", "swamp", "grassland", "tundra",
          "jungle", "coast", "hills", "valley", "plateau", "canyon"},
         TagRule::none(),
         Cardinality::Single,
         false});

    table.push_back(
        {"terrain",
         "Terrain",
         "Terrain difficulty and features",
         "#dc3545",
         {"terrain:dense", "terrain:rocky", "terrain:marshy"},
         {"dense", "sparse", "rocky", "marshy", "rugged", "smooth", "steep",
          "flat", "broken", "cultivated", "wild", "clear"},
         TagRule::none(),
         Cardinality::Multi,
         false});

    table.push_back(
        {"climate",
         "Climate",
         "Weather patterns and temperature",
         "#17a2b8",
         {"climate:temperate", "climate:arctic", "climate:tropical"},
         {"temperate", "arctic", "tropical", "arid", "humid", "dry", "wet",
          "mild", "harsh", "seasonal", "stable", "volatile"},
         TagRule::none(),
         Cardinality::Single,
         false});

    table.push_back(
        {"travel_speed",
         "Travel Speed",
         "Movement speed modifier (0.1 to 2.0)",
         "#ffc107",
         {"travel_speed:0.5", "travel_speed:1.0", "travel_speed:1.5"},
         {"0.25", "0.5", "0.75", "1.0", "1.25", "1.5", "2.0"},
         TagRule::numericRange(0.1, 2.0),
         Cardinality::Single,
         false});

    table.push_back(
        {"resources",
         "Resources",
         "Available natural resources",
         "#6f42c1",
         {"resources:timber", "resources:game", "resources:minerals"},
         {"timber", "game", "fish", "minerals", "herbs", "stone", "water",
          "food", "fuel", "rare_metals", "gems", "magical"},
         TagRule::none(),
         Cardinality::Multi,
         true});

    table.push_back(
        {"elevation",
         "Elevation",
         "Height classification",
         "#6c757d",
         {"elevation:lowland", "elevation:highland", "elevation:peak"},
         {"sea_level", "lowland", "highland", "mountain", "peak",
          "underground", "elevated", "deep", "surface"},
         TagRule::none(),
         Cardinality::Single,
         false});

    table.push_back(
        {"custom",
         "Custom",
         "User-defined properties",
         "#e83e8c",
         {"custom:haunted", "custom:sacred", "custom:dangerous"},
         {"haunted", "sacred", "dangerous", "peaceful", "magical", "cursed",
          "blessed", "ancient", "ruined", "inhabited"},
         TagRule::none(),
         Cardinality::Multi,
         true});

    table.push_back(
        {MODULE_PREFIX,
         "Module",
         "Module-specific properties (module:name:key:value)",
         "#fd7e14",
         {"module:jj:encounter_chance:0.3", "module:weather:severity:high"},
         {},
         TagRule::modulePath(2),
         Cardinality::Multi,
         true});

    return table;
}

}  // namespace

auto builtinNamespaces() -> std::span<const TagNamespace> {
    static const std::vector<TagNamespace> table = makeNamespaces();
    return table;
}

auto findNamespace(std::string_view prefix) -> const TagNamespace* {
    auto table = builtinNamespaces();
    auto it = std::find_if(table.begin(), table.end(),
                           [prefix](const TagNamespace& ns) {
                               return ns.prefix == prefix;
                           });
    return it != table.end() ? &*it : nullptr;
}

}  // namespace reaches::realm::tag
