// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "id_generator.hpp"

#include <stdexcept>
#include <string_view>

namespace reaches::realm::store {

namespace {

constexpr std::string_view ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

}  // namespace

IdGenerator::IdGenerator(size_t length)
    : IdGenerator(length, std::random_device{}()) {}

IdGenerator::IdGenerator(size_t length, std::uint64_t seed)
    : length_(length), engine_(seed) {
    if (length_ == 0) {
        throw std::invalid_argument("Id length must be positive");
    }
}

auto IdGenerator::next() -> std::string {
    std::uniform_int_distribution<size_t> pick(0, ALPHABET.size() - 1);
    std::string id;
    id.reserve(length_);
    for (size_t i = 0; i < length_; ++i) {
        id.push_back(ALPHABET[pick(engine_)]);
    }
    return id;
}

}  // namespace reaches::realm::store
