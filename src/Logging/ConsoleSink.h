/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#pragma once

#include <mutex>
#include <string>

#include "ILogSink.h"

namespace Orchestra {
namespace Core {
namespace Logging {

    /**
     * @brief Sink that writes formatted lines to the console
     *
     * Warning and above go to stderr, everything else to stdout. Output is
     * serialized so lines from concurrent players never interleave.
     *
     * Line format: `HH:MM:SS.mmm [LEVEL] [category] message`
     */
    class ConsoleSink : public ILogSink {
    public:
        explicit ConsoleSink(bool showThreadId = false) : _showThreadId(showThreadId) {}

        void write(const LogEntry& entry) override;
        void flush() override;

        // Exposed for tests
        std::string format(const LogEntry& entry) const;

    private:
        std::mutex _mutex;
        bool _showThreadId;
    };

} // namespace Logging
} // namespace Core
} // namespace Orchestra
