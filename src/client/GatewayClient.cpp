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
#include "client/GatewayClient.hpp"
#include "common/Util.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace svclink {

namespace {

ClientConfig validated(ClientConfig c) {
    if (auto v = c.validate(); !v.has_value()) {
        throw std::invalid_argument(v.error().what);
    }
    return c;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string stripTrailingSlashes(std::string s) {
    while (!s.empty() && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::optional<std::string> stringField(const nlohmann::json& object, const char* name) {
    auto i = object.find(name);
    if (i == object.end() || !i->is_string()) {
        return std::nullopt;
    }
    return i->get<std::string>();
}

constexpr std::chrono::seconds healthCheckTimeout {5};

} // namespace

GatewayClient::InFlight::InFlight(GatewayClient& c) : client {c}, entered {false} {
    std::lock_guard lock {client.inFlightMutex};
    if (client.stopCalls.load(std::memory_order_acquire)) {
        return;
    }
    ++client.inFlight;
    entered = true;
}

GatewayClient::InFlight::~InFlight() {
    if (!entered) {
        return;
    }
    std::lock_guard lock {client.inFlightMutex};
    --client.inFlight;
    client.inFlightDone.notify_all();
}

bool GatewayClient::InFlight::admitted() const {
    return entered;
}

GatewayClient::GatewayClient(ClientConfig c, HttpTransport& t, Metrics& m, CacheStore* store)
    : cfg {validated(std::move(c))},
      transport {t},
      metricsRegistry {m},
      lastHealthCheck {clock::now()},
      gatewayStatus {t, cfg.gatewayUrl, cfg.serviceToken, cfg.statusTimeout},
      breakers {cfg.circuitBreaker, cfg.circuitBreakers, cfg.gatewaySync ? &gatewayStatus : nullptr,
                [this](const std::string& target, CircuitBreaker::State s) { metricsRegistry.setCircuitState(target, s); }},
      cache {cfg.cache, store},
      repeater {cfg.retry, stopCalls,
                [this](const std::string& op, int, std::chrono::microseconds, const Error&) { metricsRegistry.recordRetry(op); }} {
    spdlog::info("GatewayClient for service {} using gateway {}", cfg.serviceName, cfg.gatewayUrl);
}

GatewayClient::~GatewayClient() {
    close();
}

GatewayClient::Result GatewayClient::call(const CallRequest& request) {
    return execute(request).result;
}

RequestOutcome GatewayClient::execute(const CallRequest& request) {
    RequestOutcome outcome {
        svclink_generate_request_id(),
        std::chrono::system_clock::now(),
        std::unexpected {Error {ErrorCode::Cancelled, "Client is closed"}},
        std::chrono::duration<double>::zero(),
        false
    };
    const auto started = clock::now();
    const InFlight guard {*this};
    if (!guard.admitted()) {
        return outcome;
    }
    const auto method = upper(request.method);
    const bool cacheable = request.useCache && method == "GET";
    metricsRegistry.recordRequest(request.target, method);

    std::optional<std::string> body;
    if (method != "GET" && request.data.has_value()) {
        try {
            body = request.data.value().dump();
        } catch (const nlohmann::json::exception& e) {
            Error error {ErrorCode::InvalidArg, std::string{"Request data is not serializable: "} + e.what()};
            error.service = request.target;
            error.endpoint = request.endpoint;
            metricsRegistry.recordFailure(request.target, method, error);
            outcome.result = std::unexpected {error};
            outcome.latency = clock::now() - started;
            return outcome;
        }
    }

    CircuitBreaker* breaker = nullptr;
    if (request.useCircuitBreaker) {
        breaker = &breakers.get(request.target);
        if (!breaker->canExecute()) {
            metricsRegistry.recordCircuitOpen(request.target);
            outcome.result = std::unexpected {Error::circuitOpen(request.target, breaker->name())};
            outcome.latency = clock::now() - started;
            return outcome;
        }
    }

    if (cacheable) {
        if (auto hit = cache.get(request.target, request.endpoint, method, request.params); hit.has_value()) {
            metricsRegistry.recordCacheHit(request.target);
            outcome.result = std::move(hit.value());
            outcome.servedFromCache = true;
            outcome.latency = clock::now() - started;
            return outcome;
        }
        metricsRegistry.recordCacheMiss(request.target);
    }

    auto single = [&] { return attemptOnce(request, method, body, outcome.requestId); };
    auto result = request.useRetry ? repeater.attempt(request.target, request.endpoint, single) : single();
    outcome.latency = clock::now() - started;

    if (result.has_value()) {
        if (breaker) {
            breaker->recordSuccess();
        }
        metricsRegistry.recordSuccess(request.target, method, outcome.latency);
        if (cacheable) {
            cache.set(request.target, request.endpoint, method, request.params, result.value());
        }
        outcome.result = std::move(result);
        return outcome;
    }

    metricsRegistry.recordFailure(request.target, method, result.error());
    if (result.error().code == ErrorCode::Cancelled) {
        outcome.result = std::move(result);
        return outcome;
    }
    if (breaker) {
        breaker->recordFailure();
    }
    if (cacheable) {
        if (auto stale = cache.get(request.target, request.endpoint, method, request.params); stale.has_value()) {
            spdlog::warn("Returning cached response for {}{} due to error: {}", request.target, request.endpoint, result.error().what);
            outcome.result = std::move(stale.value());
            outcome.servedFromCache = true;
            return outcome;
        }
    }
    outcome.result = std::move(result);
    return outcome;
}

GatewayClient::Result GatewayClient::attemptOnce(const CallRequest& request, const std::string& method, const std::optional<std::string>& body, const std::string& requestId) {
    auto endpoint = request.endpoint;
    if (!endpoint.starts_with('/')) {
        endpoint.insert(endpoint.begin(), '/');
    }
    if (!ensureGatewayAvailable()) {
        return std::unexpected {Error::serviceUnavailable("gateway", "API Gateway is unavailable")};
    }
    HttpRequest http {
        method,
        gatewayBase() + "/gateway/" + request.target + endpoint,
        Headers {
            {"X-Service-Name", cfg.serviceName},
            {"X-Service-Token", cfg.serviceToken},
            {"X-Request-ID", requestId},
            {"Content-Type", "application/json"}
        },
        request.params,
        body,
        cfg.timeoutFor(request.target, request.timeout)
    };
    for (const auto& [name, value] : request.headers) {
        http.headers.insert_or_assign(name, value);
    }
    spdlog::debug("{} {} [{}]", http.method, http.url, requestId);
    auto response = transport.send(http);
    if (!response.has_value()) {
        auto error = response.error();
        if (error.service.empty()) {
            error.service = request.target;
        }
        if (error.endpoint.empty()) {
            error.endpoint = request.endpoint;
        }
        return std::unexpected {error};
    }
    return decodeResponse(request, response.value());
}

GatewayClient::Result GatewayClient::decodeResponse(const CallRequest& request, const HttpResponse& response) const {
    if (response.status >= 200 && response.status < 300) {
        if (blank(response.body)) {
            return nlohmann::json(nullptr);
        }
        auto data = nlohmann::json::parse(response.body, nullptr, false);
        if (data.is_discarded()) {
            Error error {ErrorCode::InvalidResponse, "Invalid JSON in response from " + request.target + request.endpoint};
            error.service = request.target;
            error.endpoint = request.endpoint;
            error.status = response.status;
            return std::unexpected {error};
        }
        return data;
    }
    if (response.status >= 400 && response.status < 500) {
        return std::unexpected {parseClientError(request, response)};
    }
    auto error = Error::serviceUnavailable(request.target, "Service returned " + std::to_string(response.status) + ": " + response.body, response.status);
    error.endpoint = request.endpoint;
    return std::unexpected {error};
}

Error GatewayClient::parseClientError(const CallRequest& request, const HttpResponse& response) const {
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    auto error = [&] {
        if (body.is_discarded() || !body.is_object()) {
            return Error::clientError(response.status, response.body);
        }
        auto info = body.find("error");
        if (info == body.end() || !info->is_object()) {
            return Error::clientError(response.status, response.body);
        }
        return Error::gatewayError(
            stringField(*info, "type").value_or("Unknown"),
            stringField(*info, "message").value_or("Unknown error"),
            stringField(*info, "correlation_id"),
            response.status);
    }();
    error.service = request.target;
    error.endpoint = request.endpoint;
    return error;
}

bool GatewayClient::ensureGatewayAvailable() {
    if (cfg.gatewayHealthInterval.has_value()) {
        std::unique_lock lock {healthCheckMutex, std::try_to_lock};
        if (lock.owns_lock() && clock::now() - lastHealthCheck.load() > cfg.gatewayHealthInterval.value()) {
            checkGatewayHealth();
        }
    }
    return gatewayLive.load(std::memory_order_acquire);
}

bool GatewayClient::checkGatewayHealth() {
    HttpRequest http {"GET", gatewayBase() + "/health", Headers {}, {}, std::nullopt, healthCheckTimeout};
    auto response = transport.send(http);
    const bool live = response.has_value() && response.value().status == 200;
    lastHealthCheck.store(clock::now());
    if (gatewayLive.exchange(live) != live) {
        spdlog::info("API Gateway {} is now {}", cfg.gatewayUrl, live ? "available" : "unavailable");
    }
    return live;
}

void GatewayClient::setGatewayAvailable(bool available) {
    lastHealthCheck.store(clock::now());
    gatewayLive.store(available, std::memory_order_release);
}

bool GatewayClient::gatewayAvailable() const {
    return gatewayLive.load(std::memory_order_acquire);
}

GatewayClient::Result GatewayClient::get(const std::string& target, const std::string& endpoint, Params params, Headers headers) {
    CallRequest request {target, endpoint, "GET"};
    request.params = std::move(params);
    request.headers = std::move(headers);
    return call(request);
}

GatewayClient::Result GatewayClient::post(const std::string& target, const std::string& endpoint, std::optional<nlohmann::json> data, Headers headers) {
    CallRequest request {target, endpoint, "POST", std::move(data)};
    request.headers = std::move(headers);
    return call(request);
}

GatewayClient::Result GatewayClient::put(const std::string& target, const std::string& endpoint, std::optional<nlohmann::json> data, Headers headers) {
    CallRequest request {target, endpoint, "PUT", std::move(data)};
    request.headers = std::move(headers);
    return call(request);
}

GatewayClient::Result GatewayClient::del(const std::string& target, const std::string& endpoint, Headers headers) {
    CallRequest request {target, endpoint, "DELETE"};
    request.headers = std::move(headers);
    return call(request);
}

std::vector<GatewayClient::Result> GatewayClient::batchCall(const std::vector<CallRequest>& requests) {
    std::vector<std::optional<Result>> slots(requests.size());
    std::atomic<std::size_t> next {0};
    auto drain = [this, &requests, &slots, &next] {
        for (auto i = next.fetch_add(1); i < requests.size(); i = next.fetch_add(1)) {
            slots[i] = guardedCall(requests[i]);
        }
    };
    const auto workers = std::min(requests.size(), cfg.batchConcurrency);
    std::vector<std::future<void>> pending;
    pending.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        try {
            pending.push_back(std::async(std::launch::async, drain));
        } catch (const std::system_error& e) {
            spdlog::warn("Batch of {} runs on {} workers: {}", requests.size(), pending.size(), e.what());
            break;
        }
    }
    if (pending.empty()) {
        drain();
    }
    for (auto& f : pending) {
        f.get();
    }
    std::vector<Result> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(slot.value()));
    }
    return results;
}

GatewayClient::Result GatewayClient::guardedCall(const CallRequest& request) {
    try {
        return call(request);
    } catch (const std::exception& e) {
        spdlog::error("Call to {}{} threw: {}", request.target, request.endpoint, e.what());
        Error error {ErrorCode::Internal, e.what()};
        error.service = request.target;
        error.endpoint = request.endpoint;
        return std::unexpected {error};
    }
}

CircuitBreaker::State GatewayClient::circuitState(const std::string& target) {
    return breakers.get(target).state();
}

CircuitBreaker::Stats GatewayClient::circuitStats(const std::string& target) {
    return breakers.get(target).stats();
}

void GatewayClient::resetCircuit(const std::string& target) {
    breakers.get(target).reset();
}

void GatewayClient::clearCache(const std::optional<std::string>& target) {
    cache.clear(target);
}

ResponseCache::Stats GatewayClient::cacheStats() const {
    return cache.stats();
}

MetricsSnapshot GatewayClient::metrics() const {
    return metricsRegistry.snapshot();
}

void GatewayClient::close() {
    if (stopCalls.exchange(true)) {
        return;
    }
    std::unique_lock lock {inFlightMutex};
    inFlightDone.wait(lock, [this] { return inFlight == 0; });
    spdlog::info("GatewayClient for service {} closed", cfg.serviceName);
}

const ClientConfig& GatewayClient::config() const {
    return cfg;
}

std::string GatewayClient::gatewayBase() const {
    return stripTrailingSlashes(cfg.gatewayUrl);
}

} // namespace svclink
