/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#include "Core/Stage.h"

#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "Concurrency/FanOut.h"
#include "Logging/Logger.h"

namespace Orchestra {
namespace Core {

namespace {

    // Cleans every player on its own thread. Whatever could not be handed to a
    // thread is cleaned on the calling thread instead, so no player is skipped.
    void cleanConcurrently(const std::vector<Player*>& players, const std::string& category) noexcept {
        std::vector<char> cleaned(players.size(), 0);
        try {
            Concurrency::fanOut(players.size(), [&players, &cleaned](size_t i) {
                players[i]->clean();
                cleaned[i] = 1;
            });
        } catch (const std::system_error& e) {
            ORCHESTRA_LOG_WARNING_CAT(category, std::string("Could not spawn clean threads, cleaning inline: ") + e.what());
            for (size_t i = 0; i < players.size(); ++i) {
                if (!cleaned[i]) players[i]->clean();
            }
        }
    }

} // namespace

const char* toString(StageState state) noexcept {
    switch (state) {
        case StageState::Created: return "Created";
        case StageState::Ready:   return "Ready";
        case StageState::Failed:  return "Failed";
        case StageState::Playing: return "Playing";
        case StageState::Played:  return "Played";
        case StageState::Cleaned: return "Cleaned";
    }
    return "Unknown";
}

Stage::Stage(Config config)
    : _config(std::move(config))
    , _logCategory("Stage:" + _config.name) {}

void Stage::add(std::string name, std::unique_ptr<Player> player) {
    if (!player) {
        throw std::invalid_argument("Stage '" + _config.name + "': cannot add null player '" + name + "'");
    }
    if (_beenSetup) {
        // Every registered player must have been set up before play()
        ORCHESTRA_LOG_ERROR_CAT(_logCategory, "Rejected player '" + name + "' added after setup");
        throw std::logic_error("Stage '" + _config.name + "': cannot add player '" + name + "' after setup");
    }

    auto it = _index.find(name);
    if (it != _index.end()) {
        // Last registration wins
        debugLog("Replacing player '" + name + "'");
        _entries[it->second].player = std::move(player);
        return;
    }

    _index.emplace(name, _entries.size());
    _entries.push_back(Entry{std::move(name), std::move(player)});
}

void Stage::add(std::string name, FunctionPlayer::PlayFunction function) {
    add(std::move(name), std::make_unique<FunctionPlayer>(std::move(function)));
}

void Stage::setup() {
    _beenSetup = false;

    std::vector<Player*> setUp;
    setUp.reserve(_entries.size());

    for (auto& entry : _entries) {
        debugLog("Setting up '" + entry.name + "'");
        try {
            entry.player->setup();
        } catch (...) {
            auto cause = std::current_exception();
            ORCHESTRA_LOG_ERROR_CAT(_logCategory,
                "Player '" + entry.name + "' failed to set up: " + describeException(cause));
            rollback(setUp);
            setState(StageState::Failed);
            throw SetupError(entry.name, std::move(cause));
        }
        setUp.push_back(entry.player.get());
    }

    _beenSetup = true;
    setState(StageState::Ready);
    debugLog("Ready with " + std::to_string(_entries.size()) + " players");
}

void Stage::rollback(const std::vector<Player*>& setUp) noexcept {
    if (setUp.empty()) return;

    ORCHESTRA_LOG_WARNING_CAT(_logCategory, "Rolling back " + std::to_string(setUp.size()) + " players");
    if (_config.concurrentRollback) {
        cleanConcurrently(setUp, _logCategory);
        return;
    }

    // Clean in reverse setup order
    for (auto it = setUp.rbegin(); it != setUp.rend(); ++it) {
        (*it)->clean();
    }
}

void Stage::play(std::stop_token token) {
    if (!_beenSetup) {
        ORCHESTRA_LOG_FATAL_CAT(_logCategory, "play() called on a stage that was not set up successfully");
        std::terminate();
    }

    setState(StageState::Playing);
    debugLog("Playing " + std::to_string(_entries.size()) + " players");

    // One slot per player, each written only by that player's thread
    std::vector<std::exception_ptr> errors(_entries.size());
    try {
        Concurrency::fanOut(_entries.size(), [this, &errors, &token](size_t i) {
            try {
                _entries[i].player->play(token);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        });
    } catch (const std::system_error& e) {
        setState(StageState::Played);
        ORCHESTRA_LOG_ERROR_CAT(_logCategory, std::string("Could not spawn player threads: ") + e.what());
        throw;
    }
    setState(StageState::Played);

    PlayError::Failures failures;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (!errors[i]) continue;
        ORCHESTRA_LOG_ERROR_CAT(_logCategory,
            "Player '" + _entries[i].name + "' failed: " + describeException(errors[i]));
        failures.emplace(_entries[i].name, errors[i]);
    }

    if (!failures.empty()) {
        throw PlayError(std::move(failures));
    }
}

void Stage::clean() noexcept {
    std::vector<Player*> players;
    players.reserve(_entries.size());
    for (auto& entry : _entries) {
        players.push_back(entry.player.get());
    }

    cleanConcurrently(players, _logCategory);
    setState(StageState::Cleaned);
    debugLog("Cleaned");
}

void Stage::debugLog(const std::string& message) const {
    if (_config.enableDebugLogging) {
        ORCHESTRA_LOG_DEBUG_CAT(_logCategory, message);
    }
}

} // namespace Core
} // namespace Orchestra
