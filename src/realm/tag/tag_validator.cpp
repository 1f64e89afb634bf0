// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "tag_validator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

#include "fuzzy_scorer.hpp"
#include "tag_namespace.hpp"

namespace reaches::realm::tag {

namespace {

auto isKeyChar(char ch) -> bool {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' ||
           ch == '-';
}

auto isValueChar(char ch, bool moduleValue) -> bool {
    if (isKeyChar(ch) || ch == '.') {
        return true;
    }
    return moduleValue && (ch == ':' || ch == '/');
}

auto reject(std::string_view tag, TagErrorReason reason, std::string message)
    -> std::unexpected<TagError> {
    return std::unexpected(
        TagError{std::string(tag), reason, std::move(message)});
}

auto checkRule(const TagNamespace& ns, std::string_view value) -> bool {
    switch (ns.rule.kind) {
        case RuleKind::NumericRange: {
            auto number = parseNumber(value);
            return number && *number >= ns.rule.min && *number <= ns.rule.max;
        }
        case RuleKind::ModulePath: {
            size_t segments = 0;
            size_t start = 0;
            while (start <= value.size()) {
                auto end = value.find(':', start);
                if (end == std::string_view::npos) {
                    end = value.size();
                }
                if (end == start) {
                    return false;
                }
                ++segments;
                start = end + 1;
            }
            return segments >= ns.rule.minSegments;
        }
        case RuleKind::None:
        default:
            return true;
    }
}

}  // namespace

auto tagErrorReasonToString(TagErrorReason reason) -> std::string {
    switch (reason) {
        case TagErrorReason::Empty:
            return "Empty";
        case TagErrorReason::MissingColon:
            return "MissingColon";
        case TagErrorReason::EmptyKey:
            return "EmptyKey";
        case TagErrorReason::EmptyValue:
            return "EmptyValue";
        case TagErrorReason::ExtraColon:
            return "ExtraColon";
        case TagErrorReason::InvalidKey:
            return "InvalidKey";
        case TagErrorReason::InvalidValue:
            return "InvalidValue";
        case TagErrorReason::SemanticRule:
            return "SemanticRule";
        default:
            return "Unknown";
    }
}

auto splitTag(std::string_view tag) -> std::optional<TagParts> {
    auto colon = tag.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    return TagParts{tag.substr(0, colon), tag.substr(colon + 1)};
}

auto tagKey(std::string_view tag) -> std::string_view {
    return tag.substr(0, tag.find(':'));
}

auto validateTag(std::string_view tag) -> std::expected<void, TagError> {
    if (tag.empty()) {
        return reject(tag, TagErrorReason::Empty,
                      "Tag must be a non-empty string");
    }

    auto colon = tag.find(':');
    if (colon == std::string_view::npos) {
        return reject(tag, TagErrorReason::MissingColon,
                      "Tag must contain a colon (:) separating key and value");
    }
    if (colon == 0) {
        return reject(tag, TagErrorReason::EmptyKey,
                      "Tag must have a key before the colon");
    }
    if (colon == tag.size() - 1) {
        return reject(tag, TagErrorReason::EmptyValue,
                      "Tag must have a value after the colon");
    }

    auto key = tag.substr(0, colon);
    auto value = tag.substr(colon + 1);
    bool moduleTag = key == MODULE_PREFIX;

    if (!moduleTag && value.find(':') != std::string_view::npos) {
        return reject(tag, TagErrorReason::ExtraColon,
                      "Tag can only contain one colon (except module tags)");
    }

    if (!std::all_of(key.begin(), key.end(), isKeyChar)) {
        return reject(tag, TagErrorReason::InvalidKey,
                      "Tag key can only contain letters, numbers, "
                      "underscores, and hyphens");
    }

    if (!std::all_of(value.begin(), value.end(), [moduleTag](char ch) {
            return isValueChar(ch, moduleTag);
        })) {
        return reject(
            tag, TagErrorReason::InvalidValue,
            moduleTag ? "Tag value can only contain letters, numbers, "
                        "underscores, periods, hyphens, colons, and forward "
                        "slashes"
                      : "Tag value can only contain letters, numbers, "
                        "underscores, periods, and hyphens");
    }

    if (const auto* ns = findNamespace(key); ns && !checkRule(*ns, value)) {
        return reject(tag, TagErrorReason::SemanticRule,
                      "Invalid value for " + std::string(ns->name) + " tag");
    }

    return {};
}

auto isValidTag(std::string_view tag) -> bool {
    return validateTag(tag).has_value();
}

auto isSingleValuedKey(std::string_view key) -> bool {
    const auto* ns = findNamespace(key);
    return ns != nullptr && ns->isSingleValued();
}

auto normalizeTag(std::string_view tag) -> std::string {
    constexpr std::string_view WHITESPACE = " \t\r\n\f\v";
    auto first = tag.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = tag.find_last_not_of(WHITESPACE);
    return normalize(tag.substr(first, last - first + 1));
}

auto parseNumber(std::string_view text) -> std::optional<double> {
    if (text.empty()) {
        return std::nullopt;
    }
    const char* end = text.data() + text.size();
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace reaches::realm::tag
