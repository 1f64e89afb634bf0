// ===========================================================================
// Reaches Realm Geometry Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm Geometry
// Description: Shapes, containment tests and bounding boxes
//
// Components:
//   - Geometry: Polygon / Rectangle / Circle variant
//   - contains, bounds, intersects: pure shape queries
//   - toJson, geometryFromJson: JSON encoding of shapes
// ===========================================================================

#pragma once

#include "geometry_json.hpp"
#include "shape.hpp"
