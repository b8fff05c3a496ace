/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#include "ConsoleSink.h"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Orchestra {
namespace Core {
namespace Logging {

    std::string ConsoleSink::format(const LogEntry& entry) const {
        using namespace std::chrono;

        auto seconds = system_clock::to_time_t(entry.timestamp);
        auto millis = duration_cast<milliseconds>(entry.timestamp.time_since_epoch()).count() % 1000;

        std::tm local{};
#if defined(_WIN32)
        localtime_s(&local, &seconds);
#else
        localtime_r(&seconds, &local);
#endif

        std::ostringstream out;
        out << std::put_time(&local, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
            << " [" << toString(entry.level) << "] [" << entry.category << "] ";
        if (_showThreadId) {
            out << "(tid " << entry.threadId << ") ";
        }
        out << entry.message;
        return out.str();
    }

    void ConsoleSink::write(const LogEntry& entry) {
        if (!shouldLog(entry.level)) return;

        auto line = format(entry);
        std::lock_guard<std::mutex> lock(_mutex);
        if (entry.level >= LogLevel::Warning) {
            std::cerr << line << '\n';
        } else {
            std::cout << line << '\n';
        }
    }

    void ConsoleSink::flush() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::cout.flush();
        std::cerr.flush();
    }

} // namespace Logging
} // namespace Core
} // namespace Orchestra
