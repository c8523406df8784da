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
#ifndef SVCLINK_METRICS_METRICS_HPP
#define SVCLINK_METRICS_METRICS_HPP

#include "common/Error.hpp"
#include "common/CircuitBreaker.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace svclink {

using Labels = std::map<std::string, std::string>;

// Destination for metric events, e.g. a Prometheus registry adapter.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void increment(const std::string& name, const Labels& labels) = 0;
    virtual void observe(const std::string& name, const Labels& labels, double value) = 0;
    virtual void gauge(const std::string& name, const Labels& labels, double value) = 0;
};

// Fixed capacity ring of the most recent latencies in seconds.
class LatencyWindow {
public:
    static constexpr std::size_t capacity = 1000;

    LatencyWindow();
    void add(double seconds);
    void clear();
    [[nodiscard]] std::size_t size() const;
    // Oldest first.
    [[nodiscard]] std::vector<double> values() const;
private:
    std::array<double, capacity> ring;
    std::size_t head;
    std::size_t count;
};

struct MetricsSnapshot {
    std::uint64_t requestsTotal;
    std::uint64_t requestsSuccess;
    std::uint64_t requestsFailed;
    std::uint64_t circuitOpens;
    std::uint64_t cacheHits;
    std::uint64_t cacheMisses;
    std::uint64_t retriesTotal;
    std::optional<double> latencyP50;
    std::optional<double> latencyP95;
    std::optional<double> latencyP99;
    std::optional<double> latencyAvg;
    std::optional<double> successRate;
    std::optional<double> errorRate;
    std::optional<double> cacheHitRate;
};

class Metrics {
public:
    explicit Metrics(std::string serviceName, MetricsSink* s = nullptr);
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    void recordRequest(const std::string& target, const std::string& method);
    void recordSuccess(const std::string& target, const std::string& method, std::chrono::duration<double> latency);
    void recordFailure(const std::string& target, const std::string& method, const Error& error);
    void recordCircuitOpen(const std::string& target);
    void recordCacheHit(const std::string& target);
    void recordCacheMiss(const std::string& target);
    void recordRetry(const std::string& target);
    void setCircuitState(const std::string& target, CircuitBreaker::State state);

    [[nodiscard]] MetricsSnapshot snapshot() const;
    void reset();
    [[nodiscard]] const std::string& serviceName() const;
private:
    void increment(const std::string& name, const Labels& labels);

    const std::string service;
    MetricsSink* sink;
    mutable std::mutex m;
    std::map<std::string, std::uint64_t> counters;
    LatencyWindow latencies;
};

} // namespace svclink

#endif // SVCLINK_METRICS_METRICS_HPP
