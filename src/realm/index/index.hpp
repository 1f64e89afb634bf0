// ===========================================================================
// Reaches Realm Index Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm Index
// Description: Bounding-box pre-filter for spatial queries
//
// Components:
//   - BoundsIndex: insertion-ordered cache of region bounding boxes
// ===========================================================================

#pragma once

#include "bounds_index.hpp"
