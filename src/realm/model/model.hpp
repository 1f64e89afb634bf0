// ===========================================================================
// Reaches Realm Model Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm Model
// Description: Region data model and request types
//
// Components:
//   - Region: named, tagged shape with metadata
//   - RegionQuery: combined tag / bounds / point filter
//   - CreateRequest, RegionPatch: store mutation requests
//   - Timestamp helpers: epoch milliseconds and ISO-8601
// ===========================================================================

#pragma once

#include "region.hpp"
#include "region_patch.hpp"
#include "region_query.hpp"
#include "timestamp.hpp"
