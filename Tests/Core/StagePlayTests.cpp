/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "Core/Stage.h"
#include "Logging/Logger.h"
#include "TestHelpers/MemorySink.h"
#include "TestHelpers/RecordingPlayer.h"
#include "TestHelpers/Rendezvous.h"

using namespace Orchestra::Core;
using namespace Orchestra::Testing;
using namespace std::chrono_literals;
using Orchestra::Core::Logging::Logger;

namespace {

    // Sets up normally until told to fail
    class SwitchableSetupPlayer : public Player {
    public:
        void setup() override {
            if (failSetup) throw std::runtime_error("config changed");
        }
        void play(std::stop_token) override { playCalls.fetch_add(1); }
        void clean() noexcept override {}

        bool failSetup = false;
        std::atomic<int> playCalls{0};
    };

} // namespace

class StagePlayTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink = std::make_shared<MemorySink>();
        Logger::global().addSink(sink);
    }

    void TearDown() override {
        Logger::global().removeSink(sink);
    }

    RecordingPlayer* addPlayer(Stage& stage, const std::string& name, RecordingPlayer::Behavior behavior = {}) {
        auto player = std::make_unique<RecordingPlayer>(name, behavior);
        auto* raw = player.get();
        stage.add(name, std::move(player));
        return raw;
    }

    static RecordingPlayer::Behavior failingPlay(const std::string& message,
                                                 std::chrono::milliseconds duration = 0ms) {
        RecordingPlayer::Behavior behavior;
        behavior.playError = message;
        behavior.playDuration = duration;
        return behavior;
    }

    std::shared_ptr<MemorySink> sink;
};

TEST_F(StagePlayTest, NoFailures_PlayReturnsNormally) {
    Stage stage;
    std::vector<RecordingPlayer*> players;
    for (int i = 0; i < 4; ++i) {
        players.push_back(addPlayer(stage, "p" + std::to_string(i)));
    }

    stage.setup();
    ASSERT_NO_THROW(stage.play(std::stop_token{}));

    EXPECT_EQ(stage.state(), StageState::Played);
    for (auto* p : players) {
        EXPECT_EQ(p->playCalls.load(), 1);
        EXPECT_TRUE(p->finished.load());
    }
}

TEST_F(StagePlayTest, EmptyStagePlaysImmediately) {
    Stage stage;
    stage.setup();
    EXPECT_NO_THROW(stage.play(std::stop_token{}));
    EXPECT_EQ(stage.state(), StageState::Played);
}

TEST_F(StagePlayTest, OneFailingPlayer_ErrorMapsOnlyThatPlayer) {
    Stage stage;
    auto* a = addPlayer(stage, "a");
    auto* b = addPlayer(stage, "b", failingPlay("err-X"));
    stage.setup();

    try {
        stage.play(std::stop_token{});
        FAIL() << "play() should have thrown";
    } catch (const PlayError& e) {
        ASSERT_EQ(e.failures().size(), 1u);
        ASSERT_TRUE(e.contains("b"));
        EXPECT_EQ(describeException(e.failures().at("b")), "err-X");
        EXPECT_STREQ(e.what(), "PlayError: |b: err-X|");
    }

    stage.clean();
    EXPECT_EQ(a->cleanCalls.load(), 1);
    EXPECT_EQ(b->cleanCalls.load(), 1);
}

TEST_F(StagePlayTest, SeveralFailures_ErrorHasOneEntryPerFailingPlayer) {
    Stage stage;
    std::set<std::string> failing{"p1", "p3", "p4"};
    for (int i = 0; i < 6; ++i) {
        auto name = "p" + std::to_string(i);
        addPlayer(stage, name, failing.count(name) ? failingPlay(name + " broke") : RecordingPlayer::Behavior{});
    }
    stage.setup();

    try {
        stage.play(std::stop_token{});
        FAIL() << "play() should have thrown";
    } catch (const PlayError& e) {
        std::set<std::string> reported;
        for (const auto& [name, error] : e.failures()) {
            reported.insert(name);
            EXPECT_EQ(describeException(error), name + " broke");
        }
        EXPECT_EQ(reported, failing);
    }
}

TEST_F(StagePlayTest, WaitsForSlowestPlayerEvenAfterAFailure) {
    Stage stage;
    addPlayer(stage, "fast", failingPlay("quick failure"));
    RecordingPlayer::Behavior slowBehavior;
    slowBehavior.playDuration = 200ms;
    auto* slow = addPlayer(stage, "slow", slowBehavior);
    stage.setup();

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(stage.play(std::stop_token{}), PlayError);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(slow->finished.load());
    EXPECT_GE(elapsed, 200ms);
}

TEST_F(StagePlayTest, PlayersRunConcurrently) {
    constexpr int kPlayers = 8;
    Rendezvous rendezvous(kPlayers);
    std::atomic<int> met{0};

    Stage stage;
    for (int i = 0; i < kPlayers; ++i) {
        stage.add("p" + std::to_string(i), [&rendezvous, &met](std::stop_token) {
            if (rendezvous.arriveAndWait()) met.fetch_add(1);
        });
    }
    stage.setup();
    stage.play(std::stop_token{});

    EXPECT_EQ(met.load(), kPlayers);
}

TEST_F(StagePlayTest, StopRequestReachesEveryPlayer) {
    Stage stage;
    RecordingPlayer::Behavior untilStopped;
    untilStopped.runUntilStopped = true;
    std::vector<RecordingPlayer*> players;
    for (int i = 0; i < 4; ++i) {
        players.push_back(addPlayer(stage, "p" + std::to_string(i), untilStopped));
    }
    stage.setup();

    std::stop_source source;
    std::thread stopper([&source] {
        std::this_thread::sleep_for(50ms);
        source.request_stop();
    });

    EXPECT_NO_THROW(stage.play(source.get_token()));
    stopper.join();

    for (auto* p : players) {
        EXPECT_TRUE(p->finished.load());
    }
}

TEST_F(StagePlayTest, StopAlreadyRequested_PlayersStillRun) {
    Stage stage;
    auto* a = addPlayer(stage, "a");
    auto* b = addPlayer(stage, "b");
    stage.setup();

    std::stop_source source;
    source.request_stop();
    stage.play(source.get_token());

    // Honoring the stop token is each player's business, not the stage's
    EXPECT_EQ(a->playCalls.load(), 1);
    EXPECT_EQ(b->playCalls.load(), 1);
}

TEST_F(StagePlayTest, NonStandardExceptionIsCaptured) {
    Stage stage;
    stage.add("odd", [](std::stop_token) { throw 42; });
    stage.setup();

    try {
        stage.play(std::stop_token{});
        FAIL() << "play() should have thrown";
    } catch (const PlayError& e) {
        ASSERT_TRUE(e.contains("odd"));
        EXPECT_EQ(describeException(e.failures().at("odd")), "unknown exception");
        EXPECT_THROW(std::rethrow_exception(e.failures().at("odd")), int);
    }
}

TEST_F(StagePlayTest, PlayFailureIsLogged) {
    Stage stage({.name = "Net"});
    stage.add("socket", [](std::stop_token) { throw std::runtime_error("reset by peer"); });
    stage.setup();

    EXPECT_THROW(stage.play(std::stop_token{}), PlayError);
    EXPECT_TRUE(sink->containsMessage("Player 'socket' failed: reset by peer"));
}

TEST(StagePlayDeathTest, PlayWithoutSetupTerminates) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_DEATH(
        {
            Stage stage;
            stage.add("a", [](std::stop_token) {});
            stage.play(std::stop_token{});
        },
        "");
}

TEST(StagePlayDeathTest, PlayAfterFailedSetupTerminates) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_DEATH(
        {
            Stage stage;
            stage.add("bad", std::make_unique<RecordingPlayer>("bad", RecordingPlayer::Behavior{"no config"}));
            try {
                stage.setup();
            } catch (const SetupError&) {
            }
            stage.play(std::stop_token{});
        },
        "");
}

TEST(StagePlayDeathTest, PlayAfterSuccessfulThenFailedSetupTerminates) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_DEATH(
        {
            Stage stage;
            auto player = std::make_unique<SwitchableSetupPlayer>();
            auto* raw = player.get();
            stage.add("flip", std::move(player));
            stage.setup();
            raw->failSetup = true;
            try {
                stage.setup();
            } catch (const SetupError&) {
            }
            stage.play(std::stop_token{});
        },
        "");
}
