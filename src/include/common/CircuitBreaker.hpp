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
#ifndef SVCLINK_COMMON_CIRCUIT_BREAKER_HPP
#define SVCLINK_COMMON_CIRCUIT_BREAKER_HPP

#include "common/Error.hpp"
#include <functional>
#include <expected>
#include <optional>
#include <string>
#include <chrono>
#include <mutex>

namespace svclink {

struct CircuitBreakerConfig {
    int failureThreshold = 3;
    std::chrono::milliseconds recoveryTimeout {std::chrono::seconds{30}};
    int successThreshold = 2;
    // How often canExecute() asks the remote authority for its view of this breaker.
    std::chrono::milliseconds syncInterval {std::chrono::seconds{10}};
};

class BreakerStatusSource;

class CircuitBreaker {
public:
    enum class State : char {
        Closed,
        Open,
        HalfOpen
    };
    using clock = std::chrono::steady_clock;
    using StateListener = std::function<void(const std::string& name, State state)>;

    struct Stats {
        std::string name;
        State state;
        int failureCount;
        int successCount;
        std::optional<clock::time_point> lastFailureTime;
        clock::time_point lastStateChangeTime;
        clock::time_point lastGatewaySyncTime;
    };

    CircuitBreaker(std::string n, const CircuitBreakerConfig& c, BreakerStatusSource* remote = nullptr, StateListener listener = {});
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // May reconcile with the remote view first. An Open breaker whose recovery
    // timeout elapsed moves to HalfOpen and grants the call.
    [[nodiscard]] bool canExecute();
    void recordSuccess();
    void recordFailure();
    void reset();
    void forceState(State s);

    [[nodiscard]] State state() const;
    [[nodiscard]] int failureCount() const;
    [[nodiscard]] int successCount() const;
    [[nodiscard]] Stats stats() const;
    [[nodiscard]] const std::string& name() const;
private:
    void reconcile();
    State transitionTo(State s);
    void notify(const std::optional<State>& changed) const;

    const std::string circuitName;
    const CircuitBreakerConfig config;
    BreakerStatusSource* remoteSource;
    StateListener onStateChange;
    mutable std::mutex m;
    State currentState;
    int failures;
    int successes;
    std::optional<clock::time_point> lastFailureTime;
    clock::time_point lastStateChangeTime;
    clock::time_point lastGatewaySyncTime;
};

// Remote authority holding its own view of breaker state, e.g. the API gateway.
class BreakerStatusSource {
public:
    virtual ~BreakerStatusSource() = default;
    virtual std::expected<CircuitBreaker::State, Error> remoteState(const std::string& circuitName) = 0;
};

std::string toString(const CircuitBreaker::State& state);

// Gauge encoding: 0 closed, 1 open, 2 half-open.
int gaugeValue(const CircuitBreaker::State& state);

std::optional<CircuitBreaker::State> parseCircuitState(const std::string& text);

} // namespace svclink

#endif // SVCLINK_COMMON_CIRCUIT_BREAKER_HPP
