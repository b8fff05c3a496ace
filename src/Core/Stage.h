/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

/**
 * @file Stage.h
 * @brief Named composite of players sharing one lifecycle
 */

#pragma once

#include <atomic>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "Core/FunctionPlayer.h"
#include "Core/Player.h"
#include "Core/StageErrors.h"

namespace Orchestra {
namespace Core {

/**
 * @brief Lifecycle states of a Stage, observable through Stage::state()
 */
enum class StageState {
    Created,  ///< Players may be added, setup() not called yet
    Ready,    ///< Every player set up successfully
    Failed,   ///< A player failed to set up; the others were rolled back
    Playing,  ///< play() is waiting on its players
    Played,   ///< play() returned, successfully or not
    Cleaned   ///< clean() ran on every player
};

const char* toString(StageState state) noexcept;

/**
 * @brief Construction options for a Stage
 */
struct StageConfig {
    std::string name = "Stage";      ///< Used in log categories and diagnostics
    bool concurrentRollback = false; ///< Clean set-up players concurrently when a setup fails
    bool enableDebugLogging = false; ///< Trace every per-player lifecycle step at Debug level
};

/**
 * @brief Groups players so they are set up, played, cancelled and cleaned together
 *
 * A Stage owns its players and drives their lifecycle as a whole:
 *
 * - setup() sets players up one at a time in registration order. The first
 *   failure stops the sequence, the players already set up are cleaned, and a
 *   SetupError naming the faulty player is thrown.
 * - play() runs every player on its own thread with the same stop token and
 *   waits for all of them, however long the slowest takes. Failures are
 *   collected into a single PlayError keyed by player name.
 * - clean() cleans every player concurrently and waits for all of them.
 *
 * Stage is itself a Player, so stages nest: a child stage's SetupError or
 * PlayError is reported by the parent under the child's registered name.
 *
 * Cancellation is cooperative. The stop token handed to play() is the only
 * way to tell running players to stop; the Stage never interrupts a player.
 *
 * Players must be added before setup(); add() throws std::logic_error
 * once the stage is set up. Registration is not synchronized,
 * so concurrent add() calls must be serialized by the caller.
 *
 * @code
 * Stage stage({.name = "Services"});
 * stage.add("server", std::make_unique<HttpServer>(port));
 * stage.add("heartbeat", [](std::stop_token token) {
 *     while (!token.stop_requested()) beat();
 * });
 *
 * stage.setup();                    // throws SetupError, stage already rolled back
 * try {
 *     stage.play(stopSource.get_token());
 * } catch (const PlayError& e) {
 *     ORCHESTRA_LOG_ERROR(e.what());
 * }
 * stage.clean();
 * @endcode
 */
class Stage : public Player {
public:
    using Config = StageConfig;

    explicit Stage(Config config = {});
    ~Stage() override = default;

    // Non-copyable, non-movable (running players are referenced by index)
    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;
    Stage(Stage&&) = delete;
    Stage& operator=(Stage&&) = delete;

    /**
     * @brief Registers a player under @p name, taking ownership of it
     *
     * A name that is already registered is overwritten: the previous player
     * is destroyed and the new one takes its place in the setup order.
     * Throws std::invalid_argument for a null player and std::logic_error
     * once the stage has been set up, leaving the registry untouched.
     */
    void add(std::string name, std::unique_ptr<Player> player);

    /// Registers @p function wrapped in a FunctionPlayer
    void add(std::string name, FunctionPlayer::PlayFunction function);

    /**
     * @brief Sets up every player, all or nothing
     *
     * isSetup() is false from the start of the call until every player has
     * been set up, so a failed call leaves the stage unplayable.
     *
     * @throws SetupError if a player's setup() throws. Players set up before
     *         it have been cleaned by then; later players were never touched.
     */
    void setup() override;

    /**
     * @brief Plays every player concurrently and waits for all of them
     *
     * Calling play() without a successful setup() is a programming error and
     * terminates the process.
     *
     * @throws PlayError with one entry per failing player, after every player
     *         has returned
     */
    void play(std::stop_token token) override;

    /**
     * @brief Cleans every player concurrently and waits for all of them
     *
     * Valid in any state. Players that were never set up are cleaned as well,
     * which Player implementations are required to tolerate.
     */
    void clean() noexcept override;

    const std::string& name() const noexcept { return _config.name; }
    const Config& config() const noexcept { return _config; }

    size_t playerCount() const noexcept { return _entries.size(); }
    bool has(const std::string& name) const { return _index.count(name) != 0; }

    /// True once every player was set up successfully
    bool isSetup() const noexcept { return _beenSetup; }

    StageState state() const noexcept { return _state.load(std::memory_order_acquire); }

private:
    struct Entry {
        std::string name;
        std::unique_ptr<Player> player;
    };

    void rollback(const std::vector<Player*>& setUp) noexcept;
    void setState(StageState state) noexcept { _state.store(state, std::memory_order_release); }
    void debugLog(const std::string& message) const;

    Config _config;
    std::string _logCategory;

    std::vector<Entry> _entries;                     ///< Registration order
    std::unordered_map<std::string, size_t> _index;  ///< Name -> position in _entries

    bool _beenSetup = false;
    std::atomic<StageState> _state{StageState::Created};
};

} // namespace Core
} // namespace Orchestra
