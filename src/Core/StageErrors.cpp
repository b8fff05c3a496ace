/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#include "StageErrors.h"

#include <utility>

namespace Orchestra {
namespace Core {

std::string describeException(const std::exception_ptr& error) {
    if (!error) return "no exception";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

SetupError::SetupError(std::string player, std::exception_ptr cause)
    : std::runtime_error("SetupError: " + player + ": " + describeException(cause))
    , _player(std::move(player))
    , _cause(std::move(cause)) {}

PlayError::PlayError(Failures failures)
    : std::runtime_error(buildMessage(failures))
    , _failures(std::move(failures)) {}

std::string PlayError::buildMessage(const Failures& failures) {
    std::string message = "PlayError:";
    for (const auto& [name, error] : failures) {
        message += " |" + name + ": " + describeException(error) + "|";
    }
    return message;
}

} // namespace Core
} // namespace Orchestra
