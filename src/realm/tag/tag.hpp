// ===========================================================================
// Reaches Realm Tag Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm Tag
// Description: Tag vocabulary, validation and autocomplete
//
// Components:
//   - TagNamespace: static namespace table with value rules
//   - validateTag: key:value grammar and semantic checks
//   - relevanceScore: case-insensitive suggestion ranking
//   - TagRegistry: suggestions, conflicts and biome presets
// ===========================================================================

#pragma once

#include "fuzzy_scorer.hpp"
#include "tag_namespace.hpp"
#include "tag_registry.hpp"
#include "tag_validator.hpp"
