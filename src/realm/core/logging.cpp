// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Reaches - A spatial tag query engine for map annotation
 * Copyright (C) 2024 Max Qian
 */

#include "logging.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace reaches::realm {

auto LoggingConfig::toJson() const -> nlohmann::json {
    return {{"level", spdlog::level::to_string_view(level).data()},
            {"pattern", pattern},
            {"logger", loggerName},
            {"color", color}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.level = levelFromString(j.value("level", "info"));
    config.pattern = j.value("pattern", config.pattern);
    config.loggerName = j.value("logger", config.loggerName);
    config.color = j.value("color", true);
    return config;
}

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

auto configureLogging(const LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    spdlog::sink_ptr sink;
    if (config.color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }

    auto logger = std::make_shared<spdlog::logger>(config.loggerName, sink);
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);

    spdlog::set_default_logger(logger);
    spdlog::debug("Realm logging configured at level {}",
                  spdlog::level::to_string_view(config.level));
    return logger;
}

}  // namespace reaches::realm
