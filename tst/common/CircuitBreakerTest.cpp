// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * SVCLINK resilient service-to-service calls through an API gateway.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <expected>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"

using svclink::CircuitBreaker;
using svclink::CircuitBreakerConfig;
using svclink::BreakerStatusSource;
using svclink::Error;
using svclink::ErrorCode;
using State = svclink::CircuitBreaker::State;

namespace {

class FakeStatusSource : public BreakerStatusSource {
public:
    std::expected<State, Error> answer {State::Closed};
    std::atomic<int> queries {0};
    std::string lastName;

    std::expected<State, Error> remoteState(const std::string& circuitName) override {
        ++queries;
        lastName = circuitName;
        return answer;
    }
};

} // namespace

class CircuitBreakerTest : public ::testing::Test {
protected:
    CircuitBreakerConfig config {3, std::chrono::milliseconds{100L}, 2, std::chrono::seconds{10}};
    CircuitBreaker breaker {"orders-circuit", config};

    void open() {
        for (int i = 0; i < config.failureThreshold; ++i) {
            breaker.recordFailure();
        }
    }
};

TEST_F(CircuitBreakerTest, InitialStateClosed) {
    EXPECT_EQ(breaker.state(), State::Closed);
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_EQ(breaker.name(), "orders-circuit");
    EXPECT_FALSE(breaker.stats().lastFailureTime.has_value());
}

TEST_F(CircuitBreakerTest, FailuresBelowThresholdStayClosed) {
    breaker.recordFailure();
    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), State::Closed);
    EXPECT_EQ(breaker.failureCount(), 2);
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_TRUE(breaker.stats().lastFailureTime.has_value());
}

TEST_F(CircuitBreakerTest, ThresholdFailuresOpen) {
    open();
    EXPECT_EQ(breaker.state(), State::Open);
    EXPECT_FALSE(breaker.canExecute());
    EXPECT_FALSE(breaker.canExecute());
}

TEST_F(CircuitBreakerTest, SuccessResetsConsecutiveFailures) {
    breaker.recordFailure();
    breaker.recordFailure();
    breaker.recordSuccess();
    EXPECT_EQ(breaker.failureCount(), 0);
    breaker.recordFailure();
    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), State::Closed);
}

TEST_F(CircuitBreakerTest, RecoveryTimeoutMovesToHalfOpen) {
    open();
    std::this_thread::sleep_for(config.recoveryTimeout + std::chrono::milliseconds{20L});
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_EQ(breaker.state(), State::HalfOpen);
    EXPECT_EQ(breaker.failureCount(), 0);
    EXPECT_EQ(breaker.successCount(), 0);
    // Concurrent probes are all admitted.
    EXPECT_TRUE(breaker.canExecute());
}

TEST_F(CircuitBreakerTest, HalfOpenClosesAfterSuccessThreshold) {
    open();
    std::this_thread::sleep_for(config.recoveryTimeout + std::chrono::milliseconds{20L});
    ASSERT_TRUE(breaker.canExecute());
    breaker.recordSuccess();
    EXPECT_EQ(breaker.state(), State::HalfOpen);
    EXPECT_EQ(breaker.successCount(), 1);
    breaker.recordSuccess();
    EXPECT_EQ(breaker.state(), State::Closed);
    EXPECT_EQ(breaker.successCount(), 0);
    EXPECT_EQ(breaker.failureCount(), 0);
}

TEST_F(CircuitBreakerTest, HalfOpenFailureReopens) {
    open();
    std::this_thread::sleep_for(config.recoveryTimeout + std::chrono::milliseconds{20L});
    ASSERT_TRUE(breaker.canExecute());
    breaker.recordSuccess();
    breaker.recordFailure();
    EXPECT_EQ(breaker.state(), State::Open);
    EXPECT_FALSE(breaker.canExecute());
}

TEST_F(CircuitBreakerTest, ResetCloses) {
    open();
    breaker.reset();
    EXPECT_EQ(breaker.state(), State::Closed);
    EXPECT_EQ(breaker.failureCount(), 0);
    EXPECT_TRUE(breaker.canExecute());
}

TEST(CircuitBreakerListenerTest, TransitionsAreReported) {
    std::vector<State> seen;
    CircuitBreaker breaker {"pay-circuit", CircuitBreakerConfig{1, std::chrono::milliseconds{10L}, 1}, nullptr,
                            [&seen](const std::string& name, State s) {
                                EXPECT_EQ(name, "pay-circuit");
                                seen.push_back(s);
                            }};
    breaker.recordFailure();
    std::this_thread::sleep_for(std::chrono::milliseconds{30L});
    ASSERT_TRUE(breaker.canExecute());
    breaker.recordSuccess();
    EXPECT_EQ(seen, (std::vector<State>{State::Open, State::HalfOpen, State::Closed}));
}

TEST(CircuitBreakerListenerTest, ListenerMayReadBreaker) {
    std::vector<State> observed;
    CircuitBreaker* self = nullptr;
    CircuitBreaker breaker {"pay-circuit", CircuitBreakerConfig{1, std::chrono::milliseconds{10L}, 1}, nullptr,
                            [&observed, &self](const std::string&, State) {
                                observed.push_back(self->state());
                                EXPECT_EQ(self->stats().name, "pay-circuit");
                            }};
    self = &breaker;
    auto tripped = std::async(std::launch::async, [&breaker] {
        breaker.recordFailure();
        std::this_thread::sleep_for(std::chrono::milliseconds{20L});
        EXPECT_TRUE(breaker.canExecute());
        breaker.recordSuccess();
        breaker.reset();
    });
    ASSERT_EQ(tripped.wait_for(std::chrono::seconds{5}), std::future_status::ready);
    EXPECT_EQ(observed, (std::vector<State>{State::Open, State::HalfOpen, State::Closed, State::Closed}));
}

class CircuitBreakerSyncTest : public ::testing::Test {
protected:
    FakeStatusSource remote;
    CircuitBreakerConfig config {3, std::chrono::seconds{30}, 2, std::chrono::milliseconds{20L}};
    CircuitBreaker breaker {"orders-circuit", config, &remote};

    void waitForSync() {
        std::this_thread::sleep_for(config.syncInterval + std::chrono::milliseconds{10L});
    }
};

TEST_F(CircuitBreakerSyncTest, NotQueriedBeforeInterval) {
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_EQ(remote.queries.load(), 0);
}

TEST_F(CircuitBreakerSyncTest, RemoteOpenForcesOpen) {
    remote.answer = State::Open;
    waitForSync();
    EXPECT_FALSE(breaker.canExecute());
    EXPECT_EQ(breaker.state(), State::Open);
    EXPECT_EQ(remote.lastName, "orders-circuit");
    EXPECT_EQ(remote.queries.load(), 1);
}

TEST_F(CircuitBreakerSyncTest, RemoteClosedForcesClosed) {
    for (int i = 0; i < config.failureThreshold; ++i) {
        breaker.recordFailure();
    }
    ASSERT_EQ(breaker.state(), State::Open);
    remote.answer = State::Closed;
    waitForSync();
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_EQ(breaker.state(), State::Closed);
    EXPECT_EQ(breaker.failureCount(), 0);
}

TEST_F(CircuitBreakerSyncTest, RemoteHalfOpenChangesNothing) {
    breaker.recordFailure();
    remote.answer = State::HalfOpen;
    waitForSync();
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_EQ(breaker.state(), State::Closed);
    EXPECT_EQ(breaker.failureCount(), 1);
}

TEST_F(CircuitBreakerSyncTest, RemoteFailureKeepsLocalState) {
    for (int i = 0; i < config.failureThreshold; ++i) {
        breaker.recordFailure();
    }
    remote.answer = std::unexpected {Error {ErrorCode::Timeout, "status query timed out"}};
    waitForSync();
    EXPECT_FALSE(breaker.canExecute());
    EXPECT_EQ(breaker.state(), State::Open);
    EXPECT_EQ(remote.queries.load(), 1);
}

TEST_F(CircuitBreakerSyncTest, SyncIsRateLimited) {
    waitForSync();
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_TRUE(breaker.canExecute());
    EXPECT_EQ(remote.queries.load(), 1);
}

TEST(CircuitStateTest, ParseAndFormat) {
    EXPECT_EQ(svclink::parseCircuitState("OPEN"), State::Open);
    EXPECT_EQ(svclink::parseCircuitState("CLOSED"), State::Closed);
    EXPECT_EQ(svclink::parseCircuitState("HALF_OPEN"), State::HalfOpen);
    EXPECT_EQ(svclink::parseCircuitState("half_open"), State::HalfOpen);
    EXPECT_FALSE(svclink::parseCircuitState("FORCED_OPEN").has_value());
    EXPECT_EQ(svclink::toString(State::HalfOpen), "HALF_OPEN");
    EXPECT_EQ(svclink::gaugeValue(State::Closed), 0);
    EXPECT_EQ(svclink::gaugeValue(State::Open), 1);
    EXPECT_EQ(svclink::gaugeValue(State::HalfOpen), 2);
}
