// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_MODEL_TIMESTAMP_HPP
#define REACHES_REALM_MODEL_TIMESTAMP_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace reaches::realm::model {

/// Milliseconds since the Unix epoch (UTC)
using Timestamp = std::int64_t;

/// Source of "now" for metadata stamps; injectable for tests
using Clock = std::function<Timestamp()>;

/**
 * @brief Current wall-clock time in milliseconds
 */
[[nodiscard]] auto currentTimestamp() -> Timestamp;

/**
 * @brief Format as ISO-8601 UTC, e.g. "2024-05-01T12:00:00.250Z"
 */
[[nodiscard]] auto formatIsoTimestamp(Timestamp timestamp) -> std::string;

/**
 * @brief Parse an ISO-8601 date-time
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
 * optional "Z" or "+HH:MM"/"-HH:MM" offset; a missing offset means UTC.
 *
 * @return Milliseconds since epoch, or nullopt if malformed
 */
[[nodiscard]] auto parseIsoTimestamp(std::string_view text)
    -> std::optional<Timestamp>;

}  // namespace reaches::realm::model

#endif  // REACHES_REALM_MODEL_TIMESTAMP_HPP
