/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

/**
 * @file StageErrors.h
 * @brief Errors thrown by Stage::setup() and Stage::play()
 *
 * Both carry the children's original exceptions as std::exception_ptr so
 * callers can rethrow and inspect them. A Stage never interprets a child's
 * error; it only records which player produced it.
 */

#pragma once

#include <exception>
#include <map>
#include <stdexcept>
#include <string>

namespace Orchestra {
namespace Core {

/**
 * @brief Human readable message of a captured exception
 *
 * @return what() for std::exception, "unknown exception" for anything else,
 *         "no exception" for a null pointer
 */
std::string describeException(const std::exception_ptr& error);

/**
 * @brief A player failed to set up
 *
 * By the time this is thrown, every player of the stage that had already
 * been set up has been cleaned. The faulty player itself is not cleaned.
 */
class SetupError : public std::runtime_error {
public:
    SetupError(std::string player, std::exception_ptr cause);

    /// Registered name of the player whose setup() threw
    const std::string& player() const noexcept { return _player; }

    /// The exception thrown by that player's setup()
    const std::exception_ptr& cause() const noexcept { return _cause; }

private:
    std::string _player;
    std::exception_ptr _cause;
};

/**
 * @brief One or more players failed while playing
 *
 * Thrown only after every player of the stage has returned. Players absent
 * from failures() completed successfully.
 */
class PlayError : public std::runtime_error {
public:
    using Failures = std::map<std::string, std::exception_ptr>;

    explicit PlayError(Failures failures);

    const Failures& failures() const noexcept { return _failures; }

    bool contains(const std::string& player) const { return _failures.count(player) != 0; }

private:
    static std::string buildMessage(const Failures& failures);

    Failures _failures;
};

} // namespace Core
} // namespace Orchestra
