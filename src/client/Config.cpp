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
#include "client/Config.hpp"
#include <string>
#include <expected>
#include <variant>
#include <chrono>
#include "common/Error.hpp"
#include "cache/CacheStore.hpp"

namespace svclink {

namespace {

std::expected<std::monostate, Error> validateBreaker(const std::string& prefix, const CircuitBreakerConfig& c) {
    if (c.failureThreshold < 1) {
        return std::unexpected {Error::invalidConfiguration(prefix + ".failure_threshold", std::to_string(c.failureThreshold))};
    }
    if (c.successThreshold < 1) {
        return std::unexpected {Error::invalidConfiguration(prefix + ".success_threshold", std::to_string(c.successThreshold))};
    }
    if (c.recoveryTimeout <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error::invalidConfiguration(prefix + ".recovery_timeout", std::to_string(c.recoveryTimeout.count()))};
    }
    if (c.syncInterval <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error::invalidConfiguration(prefix + ".sync_interval", std::to_string(c.syncInterval.count()))};
    }
    return {};
}

} // namespace

std::expected<std::monostate, Error> ClientConfig::validate() const {
    if (gatewayUrl.empty()) {
        return std::unexpected {Error::invalidConfiguration("gateway_url", gatewayUrl, "Gateway URL must not be empty")};
    }
    if (!gatewayUrl.starts_with("http://") && !gatewayUrl.starts_with("https://")) {
        return std::unexpected {Error::invalidConfiguration("gateway_url", gatewayUrl)};
    }
    if (serviceName.empty()) {
        return std::unexpected {Error::invalidConfiguration("service_name", serviceName, "Service name must not be empty")};
    }
    if (gatewayTimeout <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error::invalidConfiguration("gateway_timeout", std::to_string(gatewayTimeout.count()))};
    }
    if (statusTimeout <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error::invalidConfiguration("status_timeout", std::to_string(statusTimeout.count()))};
    }
    if (gatewayHealthInterval.has_value() && gatewayHealthInterval.value() <= std::chrono::milliseconds::zero()) {
        return std::unexpected {Error::invalidConfiguration("gateway_health_interval", std::to_string(gatewayHealthInterval.value().count()))};
    }
    if (batchConcurrency == 0) {
        return std::unexpected {Error::invalidConfiguration("batch_concurrency", "0")};
    }
    if (cache.enabled && (cache.ttl <= std::chrono::seconds::zero() || cache.ttl > maxCacheTtl)) {
        return std::unexpected {Error::invalidConfiguration("cache.ttl_seconds", std::to_string(cache.ttl.count()))};
    }
    if (auto v = validateBreaker("circuit_breaker", circuitBreaker); !v.has_value()) {
        return v;
    }
    for (const auto& [target, c] : circuitBreakers) {
        if (auto v = validateBreaker("circuit_breakers." + target, c); !v.has_value()) {
            return v;
        }
    }
    for (const auto& [target, t] : serviceTimeouts) {
        if (t <= std::chrono::milliseconds::zero()) {
            return std::unexpected {Error::invalidConfiguration("service_timeouts." + target, std::to_string(t.count()))};
        }
    }
    return {};
}

const CircuitBreakerConfig& ClientConfig::breakerConfig(const std::string& target) const {
    auto i = circuitBreakers.find(target);
    return i == circuitBreakers.end() ? circuitBreaker : i->second;
}

std::chrono::milliseconds ClientConfig::timeoutFor(const std::string& target, const std::optional<std::chrono::milliseconds>& override) const {
    if (override.has_value()) {
        return override.value();
    }
    auto i = serviceTimeouts.find(target);
    return i == serviceTimeouts.end() ? gatewayTimeout : i->second;
}

} // namespace svclink
