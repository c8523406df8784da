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
#ifndef SVCLINK_CLIENT_GATEWAY_BREAKER_STATUS_HPP
#define SVCLINK_CLIENT_GATEWAY_BREAKER_STATUS_HPP

#include "common/CircuitBreaker.hpp"
#include "client/HttpTransport.hpp"
#include <chrono>
#include <expected>
#include <string>

namespace svclink {

// Reads the gateway's view of a breaker from
// GET {gateway}/internal/circuit-breaker/status/{name}.
class GatewayBreakerStatus : public BreakerStatusSource {
public:
    GatewayBreakerStatus(HttpTransport& t, std::string gatewayUrl, std::string serviceToken, std::chrono::milliseconds timeout);
    std::expected<CircuitBreaker::State, Error> remoteState(const std::string& circuitName) override;
private:
    HttpTransport& transport;
    const std::string baseUrl;
    const std::string token;
    const std::chrono::milliseconds statusTimeout;
};

} // namespace svclink

#endif // SVCLINK_CLIENT_GATEWAY_BREAKER_STATUS_HPP
