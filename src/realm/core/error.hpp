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

#ifndef REACHES_REALM_CORE_ERROR_HPP
#define REACHES_REALM_CORE_ERROR_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace reaches::realm {

/**
 * @brief Error categories reported by store and codec operations
 */
enum class RealmErrorCode : uint16_t {
    /// A proposed tag failed syntax or namespace rules
    InvalidTag = 100,

    /// An operation referenced a region id that does not exist
    NotFound = 200,

    /// A verbatim insert collided with an existing region id
    DuplicateId = 201,

    /// Import document carries an unrecognized format tag
    UnsupportedFormat = 300,

    /// Import document is not shaped like an export document
    MalformedDocument = 301,

    /// One region record inside a document is corrupt
    MalformedRecord = 302
};

/**
 * @brief Converts RealmErrorCode to string
 *
 * @param code Code to convert
 * @return String representation
 */
[[nodiscard]] inline auto realmErrorCodeToString(RealmErrorCode code)
    -> std::string {
    switch (code) {
        case RealmErrorCode::InvalidTag:
            return "InvalidTag";
        case RealmErrorCode::NotFound:
            return "NotFound";
        case RealmErrorCode::DuplicateId:
            return "DuplicateId";
        case RealmErrorCode::UnsupportedFormat:
            return "UnsupportedFormat";
        case RealmErrorCode::MalformedDocument:
            return "MalformedDocument";
        case RealmErrorCode::MalformedRecord:
            return "MalformedRecord";
        default:
            return "Unknown";
    }
}

/**
 * @brief Error value carried by std::expected results
 *
 * `subject` names the tag or region id the error is about, so callers can
 * highlight the offending input without parsing the message.
 */
struct RealmError {
    RealmErrorCode code = RealmErrorCode::NotFound;
    std::string message;
    std::string subject;

    RealmError() = default;

    RealmError(RealmErrorCode errorCode, std::string msg,
               std::string subj = {})
        : code(errorCode), message(std::move(msg)), subject(std::move(subj)) {}

    [[nodiscard]] auto toString() const -> std::string {
        std::string result = realmErrorCodeToString(code) + ": " + message;
        if (!subject.empty()) {
            result += " (" + subject + ")";
        }
        return result;
    }
};

}  // namespace reaches::realm

#endif  // REACHES_REALM_CORE_ERROR_HPP
