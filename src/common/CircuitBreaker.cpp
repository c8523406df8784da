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
#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <optional>
#include <utility>
#include <string>

namespace svclink {

CircuitBreaker::CircuitBreaker(std::string n, const CircuitBreakerConfig& c, BreakerStatusSource* remote, StateListener listener)
    : circuitName {std::move(n)},
      config {c},
      remoteSource {remote},
      onStateChange {std::move(listener)},
      currentState {State::Closed},
      failures {0},
      successes {0},
      lastFailureTime {std::nullopt},
      lastStateChangeTime {clock::now()},
      lastGatewaySyncTime {clock::now()} {}

bool CircuitBreaker::canExecute() {
    reconcile();
    std::optional<State> changed;
    bool allowed = true;
    {
        std::lock_guard lock {m};
        switch (currentState) {
            case State::Closed:
            case State::HalfOpen:
                break;
            case State::Open:
                if (clock::now() - lastStateChangeTime > config.recoveryTimeout) {
                    changed = transitionTo(State::HalfOpen);
                } else {
                    allowed = false;
                }
                break;
        }
    }
    notify(changed);
    return allowed;
}

void CircuitBreaker::recordSuccess() {
    std::optional<State> changed;
    {
        std::lock_guard lock {m};
        switch (currentState) {
            case State::HalfOpen:
                ++successes;
                if (successes >= config.successThreshold) {
                    changed = transitionTo(State::Closed);
                }
                break;
            case State::Closed:
                if (failures > 0) {
                    failures = 0;
                }
                break;
            case State::Open:
                break;
        }
    }
    notify(changed);
}

void CircuitBreaker::recordFailure() {
    std::optional<State> changed;
    {
        std::lock_guard lock {m};
        ++failures;
        lastFailureTime = clock::now();
        if (currentState == State::Closed && failures >= config.failureThreshold) {
            changed = transitionTo(State::Open);
        } else if (currentState == State::HalfOpen) {
            changed = transitionTo(State::Open);
        }
    }
    notify(changed);
}

void CircuitBreaker::reset() {
    forceState(State::Closed);
}

void CircuitBreaker::forceState(State s) {
    std::optional<State> changed;
    {
        std::lock_guard lock {m};
        changed = transitionTo(s);
    }
    notify(changed);
}

// The remote query runs unlocked; only the mutation it leads to is serialized,
// so a local failure may interleave between the query and the forced transition.
void CircuitBreaker::reconcile() {
    if (!remoteSource) {
        return;
    }
    {
        std::lock_guard lock {m};
        const auto now = clock::now();
        if (now - lastGatewaySyncTime < config.syncInterval) {
            return;
        }
        lastGatewaySyncTime = now;
    }
    auto remote = remoteSource->remoteState(circuitName);
    if (!remote.has_value()) {
        spdlog::debug("CircuitBreaker {}: gateway sync skipped: {}", circuitName, remote.error().what);
        return;
    }
    std::optional<State> changed;
    {
        std::lock_guard lock {m};
        if (remote.value() == State::Open && currentState != State::Open) {
            spdlog::info("CircuitBreaker {}: gateway reports OPEN, forcing open", circuitName);
            changed = transitionTo(State::Open);
        } else if (remote.value() == State::Closed && currentState != State::Closed) {
            spdlog::info("CircuitBreaker {}: gateway reports CLOSED, forcing closed", circuitName);
            changed = transitionTo(State::Closed);
        }
    }
    notify(changed);
}

// Caller holds m.
CircuitBreaker::State CircuitBreaker::transitionTo(State s) {
    currentState = s;
    lastStateChangeTime = clock::now();
    if (s == State::Closed || s == State::HalfOpen) {
        failures = 0;
        successes = 0;
    }
    spdlog::info("Circuit {} state changed to {}", circuitName, toString(s));
    return s;
}

// Runs with m released so listeners may read the breaker back.
void CircuitBreaker::notify(const std::optional<State>& changed) const {
    if (changed.has_value() && onStateChange) {
        onStateChange(circuitName, changed.value());
    }
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock {m};
    return currentState;
}

int CircuitBreaker::failureCount() const {
    std::lock_guard lock {m};
    return failures;
}

int CircuitBreaker::successCount() const {
    std::lock_guard lock {m};
    return successes;
}

CircuitBreaker::Stats CircuitBreaker::stats() const {
    std::lock_guard lock {m};
    return Stats {circuitName, currentState, failures, successes, lastFailureTime, lastStateChangeTime, lastGatewaySyncTime};
}

const std::string& CircuitBreaker::name() const {
    return circuitName;
}

std::string toString(const CircuitBreaker::State& state) {
    switch (state) {
        case CircuitBreaker::State::Closed: return "CLOSED";
        case CircuitBreaker::State::Open: return "OPEN";
        case CircuitBreaker::State::HalfOpen: return "HALF_OPEN";
    }
    std::unreachable();
}

int gaugeValue(const CircuitBreaker::State& state) {
    switch (state) {
        case CircuitBreaker::State::Closed: return 0;
        case CircuitBreaker::State::Open: return 1;
        case CircuitBreaker::State::HalfOpen: return 2;
    }
    std::unreachable();
}

std::optional<CircuitBreaker::State> parseCircuitState(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "CLOSED") {
        return CircuitBreaker::State::Closed;
    }
    if (upper == "OPEN") {
        return CircuitBreaker::State::Open;
    }
    if (upper == "HALF_OPEN") {
        return CircuitBreaker::State::HalfOpen;
    }
    return std::nullopt;
}

} // namespace svclink
