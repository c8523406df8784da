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
#include "cache/ResponseCache.hpp"
#include "common/Util.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace svclink {

ResponseCache::ResponseCache(const CacheConfig& c, CacheStore* s)
    : config {c},
      store {s},
      active {c.enabled && s != nullptr} {
    if (!active) {
        return;
    }
    auto pong = store->ping();
    if (!pong.has_value()) {
        spdlog::warn("Cache store unreachable: {}. Caching will be disabled.", pong.error().what);
        active = false;
    }
}

std::optional<std::string> ResponseCache::key(const std::string& service, const std::string& endpoint, const std::string& method, const Params& params) {
    // nlohmann::json objects keep their keys sorted, so the dump is order independent.
    const nlohmann::json descriptor {
        {"service", service},
        {"endpoint", endpoint},
        {"method", method},
        {"params", params}
    };
    try {
        return "service:" + service + ":endpoint:" + endpoint + ":" + svclink_md5_hex(descriptor.dump());
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("No cache key for {}{}: {}", service, endpoint, e.what());
        return std::nullopt;
    }
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& service, const std::string& endpoint, const std::string& method, const Params& params) {
    if (!active) {
        misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    const auto k = key(service, endpoint, method, params);
    if (!k.has_value()) {
        misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    auto stored = store->get(k.value());
    if (!stored.has_value()) {
        spdlog::debug("Cache read for {} failed: {}", k.value(), stored.error().what);
        misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    if (!stored.value().has_value()) {
        misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    auto data = nlohmann::json::parse(stored.value().value(), nullptr, false);
    if (data.is_discarded()) {
        spdlog::debug("Cache entry {} is not valid JSON", k.value());
        misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    hits.fetch_add(1, std::memory_order_relaxed);
    return data;
}

void ResponseCache::set(const std::string& service, const std::string& endpoint, const std::string& method, const Params& params, const nlohmann::json& data) {
    if (!active) {
        return;
    }
    const auto k = key(service, endpoint, method, params);
    if (!k.has_value()) {
        return;
    }
    std::string serialized;
    try {
        serialized = data.dump();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Could not cache data for key {}: {}", k.value(), e.what());
        return;
    }
    auto result = store->set(k.value(), serialized, config.ttl);
    if (!result.has_value()) {
        spdlog::warn("Could not cache data for key {}: {}", k.value(), result.error().what);
    }
}

void ResponseCache::clear(const std::optional<std::string>& service) {
    if (!active) {
        return;
    }
    if (!service.has_value()) {
        if (auto flushed = store->flush(); !flushed.has_value()) {
            spdlog::warn("Cache flush failed: {}", flushed.error().what);
        }
        return;
    }
    auto keys = store->scan("service:" + service.value() + ":");
    if (!keys.has_value()) {
        spdlog::warn("Cache scan for service {} failed: {}", service.value(), keys.error().what);
        return;
    }
    if (keys.value().empty()) {
        return;
    }
    if (auto erased = store->erase(keys.value()); !erased.has_value()) {
        spdlog::warn("Cache clear for service {} failed: {}", service.value(), erased.error().what);
    }
}

ResponseCache::Stats ResponseCache::stats() const {
    const auto h = hits.load(std::memory_order_relaxed);
    const auto ms = misses.load(std::memory_order_relaxed);
    const double rate = h + ms > 0 ? static_cast<double>(h) / static_cast<double>(h + ms) : 0.0;
    if (!active) {
        return Stats {false, 0, h, ms, rate};
    }
    std::size_t entries = 0;
    if (auto n = store->size(); n.has_value()) {
        entries = n.value();
    }
    return Stats {true, entries, h, ms, rate};
}

bool ResponseCache::enabled() const {
    return active;
}

} // namespace svclink
