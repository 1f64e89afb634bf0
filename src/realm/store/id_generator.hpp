// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_STORE_ID_GENERATOR_HPP
#define REACHES_REALM_STORE_ID_GENERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace reaches::realm::store {

inline constexpr size_t DEFAULT_ID_LENGTH = 16;

/**
 * @brief Random alphanumeric identifiers
 *
 * Uniqueness against existing ids is the caller's job.
 */
class IdGenerator {
public:
    /**
     * @param length Characters per id
     * @throws std::invalid_argument if length is zero
     */
    explicit IdGenerator(size_t length = DEFAULT_ID_LENGTH);

    /**
     * @brief Deterministic generator for tests
     */
    IdGenerator(size_t length, std::uint64_t seed);

    [[nodiscard]] auto next() -> std::string;

    [[nodiscard]] auto length() const noexcept -> size_t { return length_; }

private:
    size_t length_;
    std::mt19937_64 engine_;
};

}  // namespace reaches::realm::store

#endif  // REACHES_REALM_STORE_ID_GENERATOR_HPP
