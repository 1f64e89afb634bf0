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

#ifndef REACHES_REALM_TAG_TAG_NAMESPACE_HPP
#define REACHES_REALM_TAG_TAG_NAMESPACE_HPP

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace reaches::realm::tag {

/// Reserved key whose value may contain colons and slashes
inline constexpr std::string_view MODULE_PREFIX = "module";

/**
 * @brief How many tags of one key a region may carry
 */
enum class Cardinality {
    /// Adding a tag replaces any tag with the same key
    Single = 0,

    /// Tags accumulate, duplicates are no-ops
    Multi = 1
};

/**
 * @brief Discriminant for a namespace's semantic value rule
 */
enum class RuleKind {
    /// Only the syntactic rules apply
    None = 0,

    /// Value must parse as a number within [min, max]
    NumericRange = 1,

    /// Value must have at least minSegments non-empty ':'-separated parts
    ModulePath = 2
};

struct TagRule {
    RuleKind kind = RuleKind::None;
    double min = 0.0;
    double max = 0.0;
    size_t minSegments = 0;

    [[nodiscard]] static constexpr auto none() -> TagRule { return {}; }

    [[nodiscard]] static constexpr auto numericRange(double lo, double hi)
        -> TagRule {
        return {RuleKind::NumericRange, lo, hi, 0};
    }

    [[nodiscard]] static constexpr auto modulePath(size_t segments)
        -> TagRule {
        return {RuleKind::ModulePath, 0.0, 0.0, segments};
    }
};

/**
 * @brief Static descriptor of one tag namespace
 */
struct TagNamespace {
    std::string_view prefix;
    std::string_view name;
    std::string_view description;
    std::string_view color;  ///< Display colour hint for hosts
    std::vector<std::string_view> examples;     ///< Fully-qualified tags
    std::vector<std::string_view> suggestions;  ///< Bare values
    TagRule rule;
    Cardinality cardinality = Cardinality::Multi;

    /// Keep suggesting this namespace when a region already carries it
    bool suggestWhenPresent = false;

    [[nodiscard]] auto isSingleValued() const noexcept -> bool {
        return cardinality == Cardinality::Single;
    }
};

/**
 * @brief Built-in namespace table in suggestion enumeration order
 */
[[nodiscard]] auto builtinNamespaces() -> std::span<const TagNamespace>;

/**
 * @brief Look up a built-in namespace by exact prefix
 *
 * @return Pointer into the static table, or nullptr for unknown keys
 */
[[nodiscard]] auto findNamespace(std::string_view prefix)
    -> const TagNamespace*;

}  // namespace reaches::realm::tag

#endif  // REACHES_REALM_TAG_TAG_NAMESPACE_HPP
