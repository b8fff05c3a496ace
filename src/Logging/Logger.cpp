/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <string>

#include "../CoreCommon.h"
#include "ConsoleSink.h"

namespace Orchestra {
namespace Core {
namespace Logging {

    std::optional<LogLevel> parseLogLevel(std::string_view name) {
        std::string lowered(name.size(), '\0');
        std::transform(name.begin(), name.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "trace") return LogLevel::Trace;
        if (lowered == "debug") return LogLevel::Debug;
        if (lowered == "info") return LogLevel::Info;
        if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
        if (lowered == "error") return LogLevel::Error;
        if (lowered == "fatal") return LogLevel::Fatal;
        return std::nullopt;
    }

    Logger& Logger::global() {
        static Logger* instance = [] {
            auto* logger = new Logger();
            logger->addSink(std::make_shared<ConsoleSink>());
            logger->setMinLevel(LogLevel::Info);
            if (auto env = safeGetEnv(kLevelEnvironmentVariable)) {
                if (auto level = parseLogLevel(*env)) {
                    logger->setMinLevel(*level);
                }
            }
            return logger;
        }();
        // Intentionally leaked so logging from static destructors stays valid
        return *instance;
    }

    void Logger::addSink(std::shared_ptr<ILogSink> sink) {
        if (!sink) return;
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.push_back(std::move(sink));
    }

    bool Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        auto it = std::find(_sinks.begin(), _sinks.end(), sink);
        if (it == _sinks.end()) return false;
        _sinks.erase(it);
        return true;
    }

    void Logger::clearSinks() {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        _sinks.clear();
    }

    size_t Logger::sinkCount() const {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        return _sinks.size();
    }

    void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
        if (!isEnabled(level)) return;

        LogEntry entry(level, std::string(category), std::string(message));

        std::lock_guard<std::mutex> lock(_sinksMutex);
        for (auto& sink : _sinks) {
            if (sink->shouldLog(level)) {
                sink->write(entry);
                if (level == LogLevel::Fatal) {
                    sink->flush();
                }
            }
        }
    }

    void Logger::flush() {
        std::lock_guard<std::mutex> lock(_sinksMutex);
        for (auto& sink : _sinks) {
            sink->flush();
        }
    }

} // namespace Logging
} // namespace Core
} // namespace Orchestra
