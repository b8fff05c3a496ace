/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#pragma once

#include <stop_token>

namespace Orchestra {
    namespace Core {

        /**
         * @brief Base interface for a unit of concurrent work
         *
         * A player goes through a three phase lifecycle driven by its owner:
         *
         *     setup() -> play() -> clean()
         *
         * or, when a sibling fails to set up before this player gets to run:
         *
         *     setup() -> clean()
         *
         * play() is only ever called after setup() returned normally. This keeps
         * initialization, the work itself and resource release separate, so
         * independently written players can be grouped in a Stage without
         * knowing about each other.
         *
         * Failure is signalled by throwing from setup() or play(). The owner
         * captures the exception and forwards it untouched.
         */
        class Player {
        public:
            virtual ~Player() = default;

            /**
             * @brief Acquires whatever the player needs before it can run
             *
             * Throws on failure. A player whose setup() throws is not cleaned by
             * its Stage, so it must release anything it acquired before throwing.
             */
            virtual void setup() = 0;

            /**
             * @brief Performs the work
             *
             * Cancellation is cooperative: the player is never preempted and is
             * expected to poll @p token (or register a std::stop_callback) and
             * return promptly once stop is requested.
             *
             * Returning normally means success; throwing reports a failure.
             */
            virtual void play(std::stop_token token) = 0;

            /**
             * @brief Releases resources acquired in setup(), best effort
             *
             * Must be safe to call whether or not play() ran. Cleanup failures
             * cannot be reported.
             */
            virtual void clean() noexcept = 0;
        };

    } // namespace Core
} // namespace Orchestra
