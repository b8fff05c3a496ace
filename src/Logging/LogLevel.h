/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

/**
 * @file LogLevel.h
 * @brief Severity levels for the Orchestra logging system
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Orchestra {
namespace Core {
namespace Logging {

    /**
     * @brief Severity of a log entry, ordered from most to least verbose
     *
     * Sinks and the Logger drop entries below their configured minimum level.
     */
    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5
    };

    /**
     * @brief Fixed-width name of a level, suitable for aligned console output
     */
    constexpr std::string_view toString(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
        }
        return "?????";
    }

    /**
     * @brief Parses a level name (case-insensitive)
     *
     * Accepts trace, debug, info, warn/warning, error and fatal.
     *
     * @return The parsed level, or std::nullopt for an unrecognized name
     */
    std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace Logging
} // namespace Core
} // namespace Orchestra
