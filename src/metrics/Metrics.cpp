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
#include "metrics/Metrics.hpp"
#include <algorithm>
#include <numeric>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace svclink {

namespace {

constexpr const char* requestsTotal = "requests_total";
constexpr const char* requestsSuccess = "requests_success";
constexpr const char* requestsFailed = "requests_failed";
constexpr const char* circuitOpens = "circuit_opens";
constexpr const char* cacheHits = "cache_hits";
constexpr const char* cacheMisses = "cache_misses";
constexpr const char* retriesTotal = "retries_total";

double percentile(const std::vector<double>& sorted, double q) {
    auto i = static_cast<std::size_t>(static_cast<double>(sorted.size()) * q);
    return sorted[std::min(i, sorted.size() - 1)];
}

} // namespace

LatencyWindow::LatencyWindow() : ring{}, head {0}, count {0} {}

void LatencyWindow::add(double seconds) {
    ring[head] = seconds;
    head = (head + 1) % capacity;
    if (count < capacity) {
        ++count;
    }
}

void LatencyWindow::clear() {
    head = 0;
    count = 0;
}

std::size_t LatencyWindow::size() const {
    return count;
}

std::vector<double> LatencyWindow::values() const {
    std::vector<double> v;
    v.reserve(count);
    const auto start = (head + capacity - count) % capacity;
    for (std::size_t i = 0; i < count; ++i) {
        v.push_back(ring[(start + i) % capacity]);
    }
    return v;
}

Metrics::Metrics(std::string serviceName, MetricsSink* s)
    : service {std::move(serviceName)},
      sink {s} {}

void Metrics::increment(const std::string& name, const Labels& labels) {
    {
        std::lock_guard lock {m};
        ++counters[name];
    }
    if (sink) {
        sink->increment(name, labels);
    }
}

void Metrics::recordRequest(const std::string& target, const std::string& method) {
    increment(requestsTotal, Labels{{"service", service}, {"target", target}, {"method", method}});
}

void Metrics::recordSuccess(const std::string& target, const std::string& method, std::chrono::duration<double> latency) {
    {
        std::lock_guard lock {m};
        latencies.add(latency.count());
    }
    increment(requestsSuccess, Labels{{"service", service}, {"target", target}, {"method", method}});
    if (sink) {
        sink->observe("request_latency_seconds", Labels{{"service", service}, {"target", target}, {"method", method}}, latency.count());
    }
}

void Metrics::recordFailure(const std::string& target, const std::string& method, const Error& error) {
    const auto status = error.status != 0 ? std::to_string(error.status) : toString(error.code);
    increment(requestsFailed, Labels{{"service", service}, {"target", target}, {"method", method}, {"status", status}});
}

void Metrics::recordCircuitOpen(const std::string& target) {
    increment(circuitOpens, Labels{{"service", service}, {"target", target}});
}

void Metrics::recordCacheHit(const std::string& target) {
    increment(cacheHits, Labels{{"service", service}, {"target", target}});
}

void Metrics::recordCacheMiss(const std::string& target) {
    increment(cacheMisses, Labels{{"service", service}, {"target", target}});
}

void Metrics::recordRetry(const std::string& target) {
    increment(retriesTotal, Labels{{"service", service}, {"target", target}});
}

void Metrics::setCircuitState(const std::string& target, CircuitBreaker::State state) {
    if (sink) {
        sink->gauge("circuit_state", Labels{{"service", service}, {"target", target}}, gaugeValue(state));
    }
}

MetricsSnapshot Metrics::snapshot() const {
    std::vector<double> sorted;
    MetricsSnapshot s {};
    {
        std::lock_guard lock {m};
        auto counter = [this](const char* name) -> std::uint64_t {
            auto i = counters.find(name);
            return i == counters.end() ? 0 : i->second;
        };
        s.requestsTotal = counter(requestsTotal);
        s.requestsSuccess = counter(requestsSuccess);
        s.requestsFailed = counter(requestsFailed);
        s.circuitOpens = counter(circuitOpens);
        s.cacheHits = counter(cacheHits);
        s.cacheMisses = counter(cacheMisses);
        s.retriesTotal = counter(retriesTotal);
        sorted = latencies.values();
    }
    if (!sorted.empty()) {
        std::sort(sorted.begin(), sorted.end());
        s.latencyP50 = percentile(sorted, 0.5);
        s.latencyP95 = percentile(sorted, 0.95);
        s.latencyP99 = percentile(sorted, 0.99);
        s.latencyAvg = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(sorted.size());
    }
    if (s.requestsTotal > 0) {
        s.successRate = static_cast<double>(s.requestsSuccess) / static_cast<double>(s.requestsTotal);
        s.errorRate = static_cast<double>(s.requestsFailed) / static_cast<double>(s.requestsTotal);
    }
    if (s.cacheHits + s.cacheMisses > 0) {
        s.cacheHitRate = static_cast<double>(s.cacheHits) / static_cast<double>(s.cacheHits + s.cacheMisses);
    }
    return s;
}

void Metrics::reset() {
    std::lock_guard lock {m};
    counters.clear();
    latencies.clear();
}

const std::string& Metrics::serviceName() const {
    return service;
}

} // namespace svclink
