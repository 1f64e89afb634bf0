// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "timestamp.hpp"

#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace reaches::realm::model {

namespace {

constexpr Timestamp MS_PER_SECOND = 1000;

auto floorDiv(Timestamp value, Timestamp divisor) -> Timestamp {
    Timestamp quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

auto toUtc(std::time_t seconds) -> std::tm {
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    return tm;
}

auto fromUtc(std::tm& tm) -> std::time_t {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

}  // namespace

auto currentTimestamp() -> Timestamp {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto formatIsoTimestamp(Timestamp timestamp) -> std::string {
    Timestamp seconds = floorDiv(timestamp, MS_PER_SECOND);
    Timestamp millis = timestamp - seconds * MS_PER_SECOND;

    auto tm = toUtc(static_cast<std::time_t>(seconds));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis << 'Z';
    return oss.str();
}

auto parseIsoTimestamp(std::string_view text) -> std::optional<Timestamp> {
    std::tm tm{};
    std::istringstream iss{std::string(text)};
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    Timestamp millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        Timestamp scale = 100;
        int digits = 0;
        while (std::isdigit(iss.peek()) != 0) {
            auto digit = static_cast<Timestamp>(iss.get() - '0');
            millis += digit * scale;
            scale /= 10;
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    Timestamp offsetMinutes = 0;
    int next = iss.peek();
    if (next == 'Z' || next == 'z') {
        iss.get();
    } else if (next == '+' || next == '-') {
        int sign = iss.get() == '-' ? -1 : 1;
        int hours = 0;
        int minutes = 0;
        char separator = 0;
        iss >> hours >> separator >> minutes;
        if (iss.fail() || separator != ':') {
            return std::nullopt;
        }
        offsetMinutes = sign * (hours * 60 + minutes);
    }

    if (iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    auto seconds = static_cast<Timestamp>(fromUtc(tm));
    return (seconds - offsetMinutes * 60) * MS_PER_SECOND + millis;
}

}  // namespace reaches::realm::model
