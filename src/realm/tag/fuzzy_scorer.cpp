// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "fuzzy_scorer.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace reaches::realm::tag {

auto levenshteinDistance(std::string_view s1, std::string_view s2) noexcept
    -> int {
    size_t m = s1.length();
    size_t n = s2.length();

    if (m == 0) {
        return static_cast<int>(n);
    }
    if (n == 0) {
        return static_cast<int>(m);
    }

    std::vector<int> prev(n + 1);
    std::vector<int> curr(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev[j] = static_cast<int>(j);
    }

    for (size_t i = 1; i <= m; ++i) {
        curr[0] = static_cast<int>(i);

        for (size_t j = 1; j <= n; ++j) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1,           // deletion
                                curr[j - 1] + 1,       // insertion
                                prev[j - 1] + cost});  // substitution
        }

        std::swap(prev, curr);
    }

    return prev[n];
}

auto normalize(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.length());

    for (char ch : s) {
        result.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    return result;
}

auto containsIgnoreCase(std::string_view haystack, std::string_view needle)
    -> bool {
    return normalize(haystack).find(normalize(needle)) != std::string::npos;
}

auto relevanceScore(std::string_view candidate, std::string_view fragment)
    -> double {
    auto c = normalize(candidate);
    auto f = normalize(fragment);

    if (c == f) {
        return SCORE_EXACT;
    }
    if (c.starts_with(f)) {
        return SCORE_PREFIX;
    }
    if (c.find(f) != std::string::npos) {
        return SCORE_SUBSTRING;
    }

    // c != f here, so at least one is non-empty
    auto distance = static_cast<double>(levenshteinDistance(c, f));
    auto longest = static_cast<double>(std::max(c.length(), f.length()));
    return std::max(0.0,
                    SCORE_FUZZY_MAX - (distance / longest) * SCORE_FUZZY_MAX);
}

}  // namespace reaches::realm::tag
