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
#include "common/RetryPolicy.hpp"
#include <stdexcept>
#include <chrono>
#include <string>
#include <utility>

namespace svclink {

std::string toString(const BackoffStrategy& strategy) {
    switch (strategy) {
        case BackoffStrategy::Exponential: return "exponential";
        case BackoffStrategy::Linear: return "linear";
        case BackoffStrategy::Constant: return "constant";
    }
    std::unreachable();
}

RetryPolicy::RetryPolicy(
    int attempts,
    BackoffStrategy s,
    std::chrono::microseconds initial,
    std::chrono::microseconds max)
    : maxAttempts(attempts),
      strategy(s),
      initialDelay(initial),
      maxDelay(max) {
    if (attempts < 1) {
        throw std::invalid_argument("Max attempts must be >= 1.");
    }
    if (initial <= std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Initial delay must be > zero.");
    }
    if (max < initial) {
        throw std::invalid_argument("Max delay must be >= initial delay.");
    }
}

} // namespace svclink
