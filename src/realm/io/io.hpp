// ===========================================================================
// Reaches Realm IO Module Header
// ===========================================================================
// This project is licensed under the terms of the GPL3 license.
//
// Module: Realm IO
// Description: Export documents, import policies and scene bundles
//
// Components:
//   - ExportDocument, ImportResult: document and import statistics types
//   - DocumentCodec: export / import with skip, merge and replace
// ===========================================================================

#pragma once

#include "document_codec.hpp"
#include "export_document.hpp"
