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
#ifndef SVCLINK_CLIENT_GATEWAY_CLIENT_HPP
#define SVCLINK_CLIENT_GATEWAY_CLIENT_HPP

#include "client/Config.hpp"
#include "client/HttpTransport.hpp"
#include "client/CircuitBreakerRegistry.hpp"
#include "client/GatewayBreakerStatus.hpp"
#include "cache/CacheStore.hpp"
#include "cache/ResponseCache.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Repeater.hpp"
#include "common/Error.hpp"
#include "metrics/Metrics.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace svclink {

struct CallRequest {
    std::string target;
    std::string endpoint;
    std::string method = "GET";
    std::optional<nlohmann::json> data {};
    Params params {};
    Headers headers {};
    // Bounds each transport attempt, not the retry loop around it.
    std::optional<std::chrono::milliseconds> timeout {};
    bool useCache = true;
    bool useCircuitBreaker = true;
    bool useRetry = true;
};

struct RequestOutcome {
    std::string requestId;
    std::chrono::system_clock::time_point startedAt;
    std::expected<nlohmann::json, Error> result;
    std::chrono::duration<double> latency;
    bool servedFromCache;
};

// Calls other services through the API gateway, guarded per target by a
// circuit breaker, a retry policy and a response cache used as fallback.
class GatewayClient {
public:
    using Result = std::expected<nlohmann::json, Error>;

    // Throws std::invalid_argument when the configuration does not validate.
    GatewayClient(ClientConfig c, HttpTransport& t, Metrics& m, CacheStore* store = nullptr);
    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;
    ~GatewayClient();

    Result call(const CallRequest& request);
    RequestOutcome execute(const CallRequest& request);
    Result get(const std::string& target, const std::string& endpoint, Params params = {}, Headers headers = {});
    Result post(const std::string& target, const std::string& endpoint, std::optional<nlohmann::json> data = std::nullopt, Headers headers = {});
    Result put(const std::string& target, const std::string& endpoint, std::optional<nlohmann::json> data = std::nullopt, Headers headers = {});
    Result del(const std::string& target, const std::string& endpoint, Headers headers = {});
    // Runs the requests on at most batchConcurrency threads; the i-th result belongs
    // to the i-th request. A call that throws yields an Internal error in its slot.
    std::vector<Result> batchCall(const std::vector<CallRequest>& requests);

    CircuitBreaker::State circuitState(const std::string& target);
    CircuitBreaker::Stats circuitStats(const std::string& target);
    void resetCircuit(const std::string& target);
    void clearCache(const std::optional<std::string>& target = std::nullopt);
    [[nodiscard]] ResponseCache::Stats cacheStats() const;
    [[nodiscard]] MetricsSnapshot metrics() const;

    void setGatewayAvailable(bool available);
    [[nodiscard]] bool gatewayAvailable() const;
    // GET {gateway}/health; only a 200 counts as live. Updates the liveness flag.
    bool checkGatewayHealth();

    // Refuses new calls, wakes sleeping retries and waits for in-flight calls.
    void close();
    [[nodiscard]] const ClientConfig& config() const;
private:
    using clock = std::chrono::steady_clock;

    class InFlight {
    public:
        explicit InFlight(GatewayClient& c);
        ~InFlight();
        InFlight(const InFlight&) = delete;
        InFlight& operator=(const InFlight&) = delete;
        [[nodiscard]] bool admitted() const;
    private:
        GatewayClient& client;
        bool entered;
    };

    Result guardedCall(const CallRequest& request);
    Result attemptOnce(const CallRequest& request, const std::string& method, const std::optional<std::string>& body, const std::string& requestId);
    Result decodeResponse(const CallRequest& request, const HttpResponse& response) const;
    Error parseClientError(const CallRequest& request, const HttpResponse& response) const;
    bool ensureGatewayAvailable();
    std::string gatewayBase() const;

    const ClientConfig cfg;
    HttpTransport& transport;
    Metrics& metricsRegistry;
    std::atomic<bool> stopCalls {false};
    std::atomic<bool> gatewayLive {true};
    std::atomic<clock::time_point> lastHealthCheck;
    std::mutex healthCheckMutex;
    GatewayBreakerStatus gatewayStatus;
    CircuitBreakerRegistry breakers;
    ResponseCache cache;
    Repeater repeater;
    std::mutex inFlightMutex;
    std::condition_variable inFlightDone;
    std::size_t inFlight {0};
};

} // namespace svclink

#endif // SVCLINK_CLIENT_GATEWAY_CLIENT_HPP
