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
#ifndef SVCLINK_CLIENT_CIRCUIT_BREAKER_REGISTRY_HPP
#define SVCLINK_CLIENT_CIRCUIT_BREAKER_REGISTRY_HPP

#include "common/CircuitBreaker.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace svclink {

// One breaker per target service, created on first access and kept for the
// lifetime of the registry. Returned references stay valid until then.
class CircuitBreakerRegistry {
public:
    // listener receives the target service name, not the breaker name.
    CircuitBreakerRegistry(const CircuitBreakerConfig& defaults,
                           std::unordered_map<std::string, CircuitBreakerConfig> overrides = {},
                           BreakerStatusSource* remote = nullptr,
                           CircuitBreaker::StateListener listener = {});
    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    CircuitBreaker& get(const std::string& target);
    [[nodiscard]] CircuitBreaker* find(const std::string& target) const;
    [[nodiscard]] std::vector<CircuitBreaker::Stats> stats() const;
    [[nodiscard]] std::size_t size() const;

    static std::string breakerName(const std::string& target);
private:
    const CircuitBreakerConfig defaultConfig;
    const std::unordered_map<std::string, CircuitBreakerConfig> targetConfigs;
    BreakerStatusSource* remoteSource;
    CircuitBreaker::StateListener onStateChange;
    std::unordered_map<std::string, std::unique_ptr<CircuitBreaker>> breakers;
    mutable std::shared_mutex m;
};

} // namespace svclink

#endif // SVCLINK_CLIENT_CIRCUIT_BREAKER_REGISTRY_HPP
