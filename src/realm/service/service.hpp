// ===========================================================================
// Reaches Realm Service Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm Service
// Description: Host-facing facade over store, registry and codec
//
// Components:
//   - RealmEngine: one scope's store, tag registry and document codec
// ===========================================================================

#pragma once

#include "realm_engine.hpp"
