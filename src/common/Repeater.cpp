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
#include "common/Repeater.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include <algorithm>
#include <functional>
#include <chrono>
#include <thread>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace svclink {

Repeater::Repeater(const RetryPolicy p, std::atomic<bool>& sc, RetryHook hook)
    : policy {p},
      backoff {p},
      stopCalls {sc},
      onRetry {std::move(hook)} {}

std::chrono::microseconds Repeater::nextDelay(int attempt) {
    return std::min(jitter.jitter(backoff.delay(attempt)), policy.maxDelay);
}

const RetryPolicy& Repeater::retryPolicy() const {
    return policy;
}

bool Repeater::sleep(std::chrono::microseconds delay) const {
    auto remaining = delay;
    while (!stopCalls.load(std::memory_order_acquire) && remaining > std::chrono::microseconds::zero()) {
        auto step = std::min<std::chrono::microseconds>(remaining, std::chrono::microseconds{1000});
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
    return !stopCalls.load(std::memory_order_acquire);
}

void Repeater::notifyRetry(const std::string& op, int attempt, std::chrono::microseconds delay, const Error& error) const {
    const auto seconds = std::chrono::duration<double>(delay).count();
    if (error.status == 429) {
        spdlog::warn("Rate limited (429) for {}. Retrying in {:.2f}s. Error: {}", op, seconds, error.what);
    } else {
        spdlog::warn("Attempt {} failed for {}. Retrying in {:.2f}s. Error: {}", attempt, op, seconds, error.what);
    }
    if (onRetry) {
        onRetry(op, attempt, delay, error);
    }
}

void Repeater::stop() noexcept {
    stopCalls.store(true, std::memory_order_release);
}

} // namespace svclink
