/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#pragma once

#include <functional>

#include "Player.h"

namespace Orchestra {
    namespace Core {

        /**
         * @brief Adapts a bare callable into a Player
         *
         * For work that needs neither setup nor cleanup. setup() and clean() do
         * nothing and play() forwards to the wrapped callable, so any
         * `void(std::stop_token)` function can be registered wherever a Player
         * is expected.
         *
         * @code
         * stage.add("ticker", std::make_unique<FunctionPlayer>([](std::stop_token token) {
         *     while (!token.stop_requested()) tick();
         * }));
         * @endcode
         */
        class FunctionPlayer final : public Player {
        public:
            using PlayFunction = std::function<void(std::stop_token)>;

            /// Throws std::invalid_argument if @p function is empty
            explicit FunctionPlayer(PlayFunction function);

            void setup() override {}
            void play(std::stop_token token) override;
            void clean() noexcept override {}

        private:
            const PlayFunction _function;
        };

    } // namespace Core
} // namespace Orchestra
