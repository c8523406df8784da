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
#ifndef SVCLINK_CACHE_RESPONSE_CACHE_HPP
#define SVCLINK_CACHE_RESPONSE_CACHE_HPP

#include "cache/CacheStore.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace svclink {

using Params = std::map<std::string, std::string>;

struct CacheConfig {
    bool enabled = true;
    std::chrono::seconds ttl {60};
};

// JSON response cache over a CacheStore. Every store failure degrades to a miss.
class ResponseCache {
public:
    struct Stats {
        bool enabled;
        std::size_t entries;
        std::uint64_t hits;
        std::uint64_t misses;
        double hitRate;
    };

    // store may be null, which leaves the cache disabled. An unreachable store
    // disables it as well.
    ResponseCache(const CacheConfig& c, CacheStore* s);
    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // service:{service}:endpoint:{endpoint}:{md5 of the sorted request descriptor}.
    // Empty when the descriptor cannot be serialized, e.g. for non UTF-8 params;
    // such requests are never cached.
    static std::optional<std::string> key(const std::string& service, const std::string& endpoint, const std::string& method, const Params& params);

    std::optional<nlohmann::json> get(const std::string& service, const std::string& endpoint, const std::string& method, const Params& params);
    void set(const std::string& service, const std::string& endpoint, const std::string& method, const Params& params, const nlohmann::json& data);
    void clear(const std::optional<std::string>& service = std::nullopt);
    [[nodiscard]] Stats stats() const;
    [[nodiscard]] bool enabled() const;
private:
    const CacheConfig config;
    CacheStore* store;
    bool active;
    mutable std::atomic<std::uint64_t> hits {0};
    mutable std::atomic<std::uint64_t> misses {0};
};

} // namespace svclink

#endif // SVCLINK_CACHE_RESPONSE_CACHE_HPP
