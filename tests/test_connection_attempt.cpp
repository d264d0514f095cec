// Copyright (c) 2025 Jonas Schnelli
// Distributed under the MIT software license, see the accompanying
// file license.txt or http://www.opensource.org/licenses/mit-license.php.

#include "connection_attempt.h"
#include <gtest/gtest.h>
#include <string>
#include <thread>

TEST(ConnectionAttempt, OpenWhileWaitingIsAccepted) {
    ConnectionAttempt attempt;
    attempt.begin();

    EXPECT_TRUE(attempt.accept_open());
    EXPECT_EQ(attempt.state(), ConnectionAttempt::State::OPEN);

    attempt.complete();
    EXPECT_EQ(attempt.state(), ConnectionAttempt::State::IDLE);
}

TEST(ConnectionAttempt, OpenAfterTimeoutIsRefused) {
    ConnectionAttempt attempt;
    attempt.begin();

    EXPECT_EQ(attempt.abandon(), ConnectionAttempt::State::PENDING);
    // The stack reports the open only now; it must be closed, not adopted
    EXPECT_FALSE(attempt.accept_open());
    EXPECT_EQ(attempt.state(), ConnectionAttempt::State::IDLE);
}

TEST(ConnectionAttempt, TimeoutAfterOpenReportsLinkToClose) {
    ConnectionAttempt attempt;
    attempt.begin();
    ASSERT_TRUE(attempt.accept_open());

    EXPECT_EQ(attempt.abandon(), ConnectionAttempt::State::OPEN);
    EXPECT_FALSE(attempt.accept_open());
}

TEST(ConnectionAttempt, NoOpenWithoutBegin) {
    ConnectionAttempt attempt;

    EXPECT_FALSE(attempt.accept_open());
    EXPECT_EQ(attempt.abandon(), ConnectionAttempt::State::IDLE);
}

TEST(ConnectionAttempt, SecondOpenForSameAttemptIsRefused) {
    ConnectionAttempt attempt;
    attempt.begin();

    EXPECT_TRUE(attempt.accept_open());
    EXPECT_FALSE(attempt.accept_open());
}

TEST(ConnectionAttempt, NewAttemptAfterAbandon) {
    ConnectionAttempt attempt;
    attempt.begin();
    attempt.abandon();

    attempt.begin();
    EXPECT_TRUE(attempt.accept_open());
}

TEST(ConnectionAttempt, RacingOpenAndAbandonAgreeOnOwner) {
    for (int round = 0; round < 200; ++round) {
        ConnectionAttempt attempt;
        attempt.begin();
        bool accepted = false;

        std::thread stack([&attempt, &accepted] { accepted = attempt.accept_open(); });
        ConnectionAttempt::State seen = attempt.abandon();
        stack.join();

        // Exactly one side closes the link
        if (accepted) {
            EXPECT_EQ(seen, ConnectionAttempt::State::OPEN);
        } else {
            EXPECT_EQ(seen, ConnectionAttempt::State::PENDING);
        }
        EXPECT_EQ(attempt.state(), ConnectionAttempt::State::IDLE);
    }
}

TEST(ConnectionAttempt, StateNames) {
    EXPECT_EQ(std::string(connection_attempt_state_name(ConnectionAttempt::State::IDLE)), "idle");
    EXPECT_EQ(std::string(connection_attempt_state_name(ConnectionAttempt::State::PENDING)), "pending");
    EXPECT_EQ(std::string(connection_attempt_state_name(ConnectionAttempt::State::OPEN)), "open");
}
