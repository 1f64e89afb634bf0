// ===========================================================================
// Reaches Realm Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm
// Description: Spatial tag query engine for map annotation
//
// Submodules:
//   - core: errors, logging, configuration
//   - geometry: shapes and containment
//   - tag: tag vocabulary, validation and suggestions
//   - model: region data model
//   - index: bounding-box pre-filter
//   - store: region store and queries
//   - io: export / import documents
//   - service: RealmEngine facade
// ===========================================================================

#pragma once

#include "core/core.hpp"
#include "geometry/geometry.hpp"
#include "index/index.hpp"
#include "io/io.hpp"
#include "model/model.hpp"
#include "service/service.hpp"
#include "store/store.hpp"
#include "tag/tag.hpp"
