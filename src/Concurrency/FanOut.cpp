/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#include "FanOut.h"

#include <thread>
#include <vector>

namespace Orchestra {
namespace Core {
namespace Concurrency {

    namespace {
        // Joins every started thread on scope exit, including when spawning throws
        class ThreadJoiner {
        public:
            explicit ThreadJoiner(std::vector<std::thread>& threads) : _threads(threads) {}
            ~ThreadJoiner() {
                for (auto& t : _threads) {
                    if (t.joinable()) t.join();
                }
            }

            ThreadJoiner(const ThreadJoiner&) = delete;
            ThreadJoiner& operator=(const ThreadJoiner&) = delete;

        private:
            std::vector<std::thread>& _threads;
        };
    } // namespace

    void fanOut(size_t count, const FanOutTask& task) {
        if (count == 0 || !task) return;

        std::vector<std::thread> threads;
        threads.reserve(count);
        ThreadJoiner joiner(threads);

        for (size_t i = 0; i < count; ++i) {
            threads.emplace_back([&task, i]() { task(i); });
        }
    }

} // namespace Concurrency
} // namespace Core
} // namespace Orchestra
