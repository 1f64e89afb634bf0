// ===========================================================================
// Reaches Realm Store Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm Store
// Description: Owning collection of regions with spatial and tag queries
//
// Components:
//   - RegionStore: CRUD, point / bounds / tag queries, listeners
//   - StoreEvent: change notifications
//   - IdGenerator: random alphanumeric ids
// ===========================================================================

#pragma once

#include "id_generator.hpp"
#include "region_store.hpp"
#include "store_event.hpp"
