// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#ifndef REACHES_REALM_TAG_TAG_VALIDATOR_HPP
#define REACHES_REALM_TAG_TAG_VALIDATOR_HPP

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace reaches::realm::tag {

/**
 * @brief Why a tag was rejected
 */
enum class TagErrorReason {
    Empty = 0,
    MissingColon = 1,
    EmptyKey = 2,
    EmptyValue = 3,
    ExtraColon = 4,
    InvalidKey = 5,
    InvalidValue = 6,
    SemanticRule = 7
};

[[nodiscard]] auto tagErrorReasonToString(TagErrorReason reason)
    -> std::string;

/**
 * @brief Rejected tag with a human-readable reason
 */
struct TagError {
    std::string tag;
    TagErrorReason reason = TagErrorReason::Empty;
    std::string message;
};

/**
 * @brief Key and value halves of a tag
 *
 * The key is everything before the first colon, the value everything
 * after it (module values keep their inner colons).
 */
struct TagParts {
    std::string_view key;
    std::string_view value;
};

/**
 * @brief Split a tag at its first colon
 *
 * @return Parts, or nullopt when the tag has no colon
 */
[[nodiscard]] auto splitTag(std::string_view tag) -> std::optional<TagParts>;

/**
 * @brief Key of a tag, or the whole text when there is no colon
 */
[[nodiscard]] auto tagKey(std::string_view tag) -> std::string_view;

/**
 * @brief Validate a tag against the grammar and namespace rules
 *
 * Checks run in a fixed order and the first failure is reported:
 * empty, colon placement, extra colons outside `module`, key characters,
 * value characters, then the namespace's semantic rule.
 *
 * @param tag Tag text
 * @return Nothing on success, otherwise the failure
 */
[[nodiscard]] auto validateTag(std::string_view tag)
    -> std::expected<void, TagError>;

[[nodiscard]] auto isValidTag(std::string_view tag) -> bool;

/**
 * @brief Whether a key belongs to a single-valued built-in namespace
 *
 * Unknown keys are multi-valued.
 */
[[nodiscard]] auto isSingleValuedKey(std::string_view key) -> bool;

/**
 * @brief Trim surrounding whitespace and lowercase
 */
[[nodiscard]] auto normalizeTag(std::string_view tag) -> std::string;

/**
 * @brief Parse a full numeric string
 *
 * Trailing characters make the parse fail.
 */
[[nodiscard]] auto parseNumber(std::string_view text) -> std::optional<double>;

}  // namespace reaches::realm::tag

#endif  // REACHES_REALM_TAG_TAG_VALIDATOR_HPP
