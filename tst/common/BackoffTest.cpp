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
#include <chrono>
#include <stdexcept>
#include <tuple>
#include "common/Backoff.hpp"
#include "common/RetryPolicy.hpp"

using svclink::Backoff;
using svclink::BackoffStrategy;
using svclink::RetryPolicy;

TEST(BackoffTest, ExponentialDoublesEachAttempt) {
    const Backoff backoff {RetryPolicy{5, BackoffStrategy::Exponential, std::chrono::seconds{1}, std::chrono::seconds{10}}};
    EXPECT_EQ(backoff.delay(1), std::chrono::seconds{1});
    EXPECT_EQ(backoff.delay(2), std::chrono::seconds{2});
    EXPECT_EQ(backoff.delay(3), std::chrono::seconds{4});
    EXPECT_EQ(backoff.delay(4), std::chrono::seconds{8});
}

TEST(BackoffTest, LinearGrowsByInitialDelay) {
    const Backoff backoff {RetryPolicy{5, BackoffStrategy::Linear, std::chrono::milliseconds{100}, std::chrono::seconds{1}}};
    EXPECT_EQ(backoff.delay(1), std::chrono::milliseconds{100});
    EXPECT_EQ(backoff.delay(2), std::chrono::milliseconds{200});
    EXPECT_EQ(backoff.delay(5), std::chrono::milliseconds{500});
}

TEST(BackoffTest, ConstantNeverChanges) {
    const Backoff backoff {RetryPolicy{5, BackoffStrategy::Constant, std::chrono::milliseconds{250}, std::chrono::seconds{1}}};
    for (int attempt = 1; attempt <= 5; ++attempt) {
        EXPECT_EQ(backoff.delay(attempt), std::chrono::milliseconds{250});
    }
}

TEST(BackoffTest, BaseDelayIsNotClamped) {
    // Clamping to maxDelay happens after jitter is added.
    const Backoff backoff {RetryPolicy{10, BackoffStrategy::Exponential, std::chrono::seconds{1}, std::chrono::seconds{2}}};
    EXPECT_EQ(backoff.delay(4), std::chrono::seconds{8});
}

TEST(BackoffTest, VeryLateAttemptSaturates) {
    const Backoff backoff {RetryPolicy{}};
    EXPECT_GT(backoff.delay(200), std::chrono::hours{24});
}

TEST(BackoffTest, AttemptBelowOneThrows) {
    const Backoff backoff {RetryPolicy{}};
    EXPECT_THROW(std::ignore = backoff.delay(0), std::invalid_argument);
}
