/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

/**
 * @file Logger.h
 * @brief Thread-safe logger that fans entries out to registered sinks
 *
 * Most code never touches a Logger directly and logs through the
 * ORCHESTRA_LOG_* macros, which route to Logger::global() and skip
 * building the message when the level is filtered out.
 *
 * @code
 * ORCHESTRA_LOG_INFO("Stage ready");
 * ORCHESTRA_LOG_ERROR_CAT("Stage", "player '" + name + "' failed");
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogLevel.h"

namespace Orchestra {
namespace Core {
namespace Logging {

    class Logger {
    public:
        /// Name of the environment variable read by global() for its minimum level
        static constexpr const char* kLevelEnvironmentVariable = "ORCHESTRA_LOG_LEVEL";

        /**
         * @brief Process-wide logger
         *
         * Created on first use with a single ConsoleSink. The minimum level is
         * Info unless ORCHESTRA_LOG_LEVEL names another level.
         */
        static Logger& global();

        /// Creates a logger with no sinks, accepting every level
        Logger() = default;

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void addSink(std::shared_ptr<ILogSink> sink);
        bool removeSink(const std::shared_ptr<ILogSink>& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
        bool isEnabled(LogLevel level) const noexcept { return level >= minLevel(); }

        /**
         * @brief Delivers a message to every sink whose level accepts it
         *
         * Fatal entries are flushed immediately since the process is usually
         * about to go down.
         */
        void log(LogLevel level, std::string_view category, std::string_view message);

        void flush();

    private:
        mutable std::mutex _sinksMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace Orchestra

#define ORCHESTRA_LOG_AT(lvl, cat, msg)                                                   \
    do {                                                                                   \
        auto& _orchestraLogger = ::Orchestra::Core::Logging::Logger::global();             \
        if (_orchestraLogger.isEnabled(lvl)) {                                             \
            _orchestraLogger.log((lvl), (cat), (msg));                                     \
        }                                                                                  \
    } while (0)

#define ORCHESTRA_LOG_TRACE_CAT(cat, msg) ORCHESTRA_LOG_AT(::Orchestra::Core::Logging::LogLevel::Trace, cat, msg)
#define ORCHESTRA_LOG_DEBUG_CAT(cat, msg) ORCHESTRA_LOG_AT(::Orchestra::Core::Logging::LogLevel::Debug, cat, msg)
#define ORCHESTRA_LOG_INFO_CAT(cat, msg) ORCHESTRA_LOG_AT(::Orchestra::Core::Logging::LogLevel::Info, cat, msg)
#define ORCHESTRA_LOG_WARNING_CAT(cat, msg) ORCHESTRA_LOG_AT(::Orchestra::Core::Logging::LogLevel::Warning, cat, msg)
#define ORCHESTRA_LOG_ERROR_CAT(cat, msg) ORCHESTRA_LOG_AT(::Orchestra::Core::Logging::LogLevel::Error, cat, msg)
#define ORCHESTRA_LOG_FATAL_CAT(cat, msg) ORCHESTRA_LOG_AT(::Orchestra::Core::Logging::LogLevel::Fatal, cat, msg)

// Non-category variants use the calling function as the category
#define ORCHESTRA_LOG_TRACE(msg) ORCHESTRA_LOG_TRACE_CAT(__func__, msg)
#define ORCHESTRA_LOG_DEBUG(msg) ORCHESTRA_LOG_DEBUG_CAT(__func__, msg)
#define ORCHESTRA_LOG_INFO(msg) ORCHESTRA_LOG_INFO_CAT(__func__, msg)
#define ORCHESTRA_LOG_WARNING(msg) ORCHESTRA_LOG_WARNING_CAT(__func__, msg)
#define ORCHESTRA_LOG_ERROR(msg) ORCHESTRA_LOG_ERROR_CAT(__func__, msg)
#define ORCHESTRA_LOG_FATAL(msg) ORCHESTRA_LOG_FATAL_CAT(__func__, msg)
