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
#ifndef SVCLINK_CLIENT_CONFIG_HPP
#define SVCLINK_CLIENT_CONFIG_HPP

#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "common/CircuitBreaker.hpp"
#include "cache/ResponseCache.hpp"
#include <unordered_map>
#include <expected>
#include <optional>
#include <variant>
#include <string>
#include <chrono>
#include <cstddef>

namespace svclink {

struct ClientConfig {
    // Base URL of the API gateway, e.g. http://gateway:8080
    std::string gatewayUrl;
    std::chrono::milliseconds gatewayTimeout {std::chrono::seconds{30}};

    std::string serviceName;
    std::string serviceToken;

    CircuitBreakerConfig circuitBreaker {};
    RetryPolicy retry {};
    CacheConfig cache {};

    // Per target overrides.
    std::unordered_map<std::string, std::chrono::milliseconds> serviceTimeouts {};
    std::unordered_map<std::string, CircuitBreakerConfig> circuitBreakers {};

    // Reconcile breakers with the gateway's view of them.
    bool gatewaySync = true;
    std::chrono::milliseconds statusTimeout {std::chrono::seconds{2}};
    // When set, a gateway liveness flag older than this is refreshed before the next call.
    std::optional<std::chrono::milliseconds> gatewayHealthInterval {};
    // Upper bound on the threads one batchCall starts.
    std::size_t batchConcurrency {16};

    [[nodiscard]] std::expected<std::monostate, Error> validate() const;
    [[nodiscard]] const CircuitBreakerConfig& breakerConfig(const std::string& target) const;
    [[nodiscard]] std::chrono::milliseconds timeoutFor(const std::string& target, const std::optional<std::chrono::milliseconds>& override = std::nullopt) const;
};

} // namespace svclink

#endif // SVCLINK_CLIENT_CONFIG_HPP
