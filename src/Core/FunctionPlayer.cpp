/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#include "FunctionPlayer.h"

#include <stdexcept>
#include <utility>

namespace Orchestra {
    namespace Core {

        FunctionPlayer::FunctionPlayer(PlayFunction function)
            : _function(std::move(function)) {
            if (!_function) {
                throw std::invalid_argument("FunctionPlayer requires a callable");
            }
        }

        void FunctionPlayer::play(std::stop_token token) {
            _function(std::move(token));
        }

    } // namespace Core
} // namespace Orchestra
