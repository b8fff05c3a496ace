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
#include <chrono>
#include <thread>

namespace Orchestra {
namespace Testing {

    /**
     * @brief Meeting point for a fixed number of threads
     *
     * arriveAndWait() returns true once @p expected threads have arrived, or
     * false if the timeout elapses first. Used to prove that tasks really run
     * at the same time: sequential execution can never get everyone through.
     */
    class Rendezvous {
    public:
        explicit Rendezvous(int expected) : _expected(expected) {}

        bool arriveAndWait(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
            _arrived.fetch_add(1, std::memory_order_acq_rel);
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (_arrived.load(std::memory_order_acquire) < _expected) {
                if (std::chrono::steady_clock::now() > deadline) return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return true;
        }

    private:
        const int _expected;
        std::atomic<int> _arrived{0};
    };

} // namespace Testing
} // namespace Orchestra
