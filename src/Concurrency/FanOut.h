/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

/**
 * @file FanOut.h
 * @brief Structured fan-out of indexed tasks with a completion barrier
 */

#pragma once

#include <cstddef>
#include <functional>

namespace Orchestra {
namespace Core {
namespace Concurrency {

    using FanOutTask = std::function<void(size_t index)>;

    /**
     * @brief Runs task(0) ... task(count - 1) concurrently and waits for all of them
     *
     * Every index gets its own thread, so a task that blocks for a long time
     * never delays the start of its siblings. fanOut() returns only once every
     * task has returned; there is no early exit and no timeout.
     *
     * Tasks must not throw. Callers that run foreign code capture its
     * exceptions inside the task, typically into a per-index slot, so no lock
     * is needed while collecting results.
     *
     * If a thread cannot be spawned, the tasks that did start are still joined
     * before the std::system_error propagates to the caller.
     *
     * @code
     * std::vector<std::exception_ptr> errors(players.size());
     * fanOut(players.size(), [&](size_t i) {
     *     try { players[i]->play(token); }
     *     catch (...) { errors[i] = std::current_exception(); }
     * });
     * @endcode
     */
    void fanOut(size_t count, const FanOutTask& task);

} // namespace Concurrency
} // namespace Core
} // namespace Orchestra
