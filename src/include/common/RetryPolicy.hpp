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
#ifndef SVCLINK_COMMON_RETRY_POLICY_HPP
#define SVCLINK_COMMON_RETRY_POLICY_HPP

#include <chrono>
#include <string>

namespace svclink {

enum class BackoffStrategy : char {
    Exponential,
    Linear,
    Constant
};

std::string toString(const BackoffStrategy& strategy);

struct RetryPolicy {
    explicit RetryPolicy(
        int attempts = 5,
        BackoffStrategy s = BackoffStrategy::Exponential,
        std::chrono::microseconds initial = std::chrono::seconds{1},
        std::chrono::microseconds max = std::chrono::seconds{10}
    );
    int maxAttempts;
    BackoffStrategy strategy;
    std::chrono::microseconds initialDelay;
    std::chrono::microseconds maxDelay;
};

} // namespace svclink

#endif // SVCLINK_COMMON_RETRY_POLICY_HPP
