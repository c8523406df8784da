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
#include "client/CircuitBreakerRegistry.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace svclink {

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreakerConfig& defaults,
                                               std::unordered_map<std::string, CircuitBreakerConfig> overrides,
                                               BreakerStatusSource* remote,
                                               CircuitBreaker::StateListener listener)
    : defaultConfig {defaults},
      targetConfigs {std::move(overrides)},
      remoteSource {remote},
      onStateChange {std::move(listener)} {}

std::string CircuitBreakerRegistry::breakerName(const std::string& target) {
    return target + "-circuit";
}

CircuitBreaker& CircuitBreakerRegistry::get(const std::string& target) {
    {
        const std::shared_lock lock {m};
        auto i = breakers.find(target);
        if (i != breakers.end()) {
            return *i->second;
        }
    }
    const std::unique_lock lock {m};
    auto i = breakers.find(target);
    if (i != breakers.end()) {
        return *i->second;
    }
    auto c = targetConfigs.find(target);
    const auto& config = c == targetConfigs.end() ? defaultConfig : c->second;
    CircuitBreaker::StateListener listener {};
    if (onStateChange) {
        listener = [this, target](const std::string&, CircuitBreaker::State s) { onStateChange(target, s); };
    }
    auto inserted = breakers.emplace(target, std::make_unique<CircuitBreaker>(breakerName(target), config, remoteSource, std::move(listener))).first;
    spdlog::debug("Created circuit breaker {} (failure threshold {}, recovery {} ms)", inserted->second->name(), config.failureThreshold, config.recoveryTimeout.count());
    return *inserted->second;
}

CircuitBreaker* CircuitBreakerRegistry::find(const std::string& target) const {
    const std::shared_lock lock {m};
    auto i = breakers.find(target);
    return i == breakers.end() ? nullptr : i->second.get();
}

std::vector<CircuitBreaker::Stats> CircuitBreakerRegistry::stats() const {
    const std::shared_lock lock {m};
    std::vector<CircuitBreaker::Stats> all;
    all.reserve(breakers.size());
    for (const auto& [target, breaker] : breakers) {
        all.push_back(breaker->stats());
    }
    return all;
}

std::size_t CircuitBreakerRegistry::size() const {
    const std::shared_lock lock {m};
    return breakers.size();
}

} // namespace svclink
