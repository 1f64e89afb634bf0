// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#ifndef REACHES_REALM_CORE_LOGGING_HPP
#define REACHES_REALM_CORE_LOGGING_HPP

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace reaches::realm {

/**
 * @brief Console logging settings for the realm engine
 *
 * The engine logs through the spdlog default logger. Hosts that already
 * configure spdlog can skip configureLogging() entirely.
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    std::string loggerName{"realm"};
    bool color{true};

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;
};

/**
 * @brief Convert level string to spdlog enum
 *
 * Unknown names map to info.
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Install a stdout logger built from config as the spdlog default
 *
 * @param config Logging settings
 * @return The installed logger
 */
auto configureLogging(const LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace reaches::realm

#endif  // REACHES_REALM_CORE_LOGGING_HPP
