// ===========================================================================
// Reaches Realm Core Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm Core
// Description: Errors, logging setup and engine configuration
//
// Components:
//   - RealmError: error value carried by std::expected results
//   - LoggingConfig, configureLogging: spdlog console setup
//   - EngineConfig: per-scope engine settings
// ===========================================================================

#pragma once

#include "engine_config.hpp"
#include "error.hpp"
#include "logging.hpp"
