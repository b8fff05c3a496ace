/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#pragma once

#include <atomic>

#include "LogEntry.h"

namespace Orchestra {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * Sinks are invoked from whichever thread logged the entry, so write()
     * must be thread safe. Level filtering happens in shouldLog() before
     * write() is called.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() = 0;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }

        bool shouldLog(LogLevel level) const noexcept { return level >= minLevel(); }

    private:
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace Orchestra
