// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_TAG_FUZZY_SCORER_HPP
#define REACHES_REALM_TAG_FUZZY_SCORER_HPP

#include <string>
#include <string_view>

namespace reaches::realm::tag {

/// Score tiers used by relevanceScore
inline constexpr double SCORE_EXACT = 100.0;
inline constexpr double SCORE_PREFIX = 80.0;
inline constexpr double SCORE_SUBSTRING = 60.0;
inline constexpr double SCORE_FUZZY_MAX = 40.0;

/**
 * @brief Calculate Levenshtein distance between two strings
 *
 * Unit cost for insertion, deletion and substitution. Uses two rows of
 * O(n) storage.
 *
 * @param s1 First string
 * @param s2 Second string
 * @return Edit distance
 */
[[nodiscard]] auto levenshteinDistance(std::string_view s1,
                                       std::string_view s2) noexcept -> int;

/**
 * @brief Lowercase a string for case-insensitive comparison
 */
[[nodiscard]] auto normalize(std::string_view s) -> std::string;

/**
 * @brief Rank a candidate against a typed fragment
 *
 * Case-insensitive. Exact match scores 100, prefix 80, substring 60,
 * otherwise 40 scaled down by the normalized edit distance (floored at 0).
 *
 * @param candidate Suggestion text
 * @param fragment Text typed so far
 * @return Score in [0, 100]
 */
[[nodiscard]] auto relevanceScore(std::string_view candidate,
                                  std::string_view fragment) -> double;

/**
 * @brief Case-insensitive substring test
 */
[[nodiscard]] auto containsIgnoreCase(std::string_view haystack,
                                      std::string_view needle) -> bool;

}  // namespace reaches::realm::tag

#endif  // REACHES_REALM_TAG_FUZZY_SCORER_HPP
