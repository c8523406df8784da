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
#ifndef SVCLINK_CACHE_IN_MEMORY_CACHE_STORE_HPP
#define SVCLINK_CACHE_IN_MEMORY_CACHE_STORE_HPP

#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <expected>
#include <optional>
#include <chrono>
#include "common/Error.hpp"
#include "cache/CacheStore.hpp"

namespace svclink {

class InMemoryCacheStore : public CacheStore {
public:
    using clock = std::chrono::steady_clock;

    InMemoryCacheStore();
    std::expected<std::optional<std::string>, Error> get(const std::string& key) override;
    std::expected<std::monostate, Error> set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    std::expected<std::vector<std::string>, Error> scan(const std::string& prefix) override;
    std::expected<std::size_t, Error> erase(const std::vector<std::string>& keys) override;
    std::expected<std::monostate, Error> flush() override;
    std::expected<std::size_t, Error> size() override;
    std::expected<std::monostate, Error> ping() override;
private:
    struct Entry {
        std::string value;
        clock::time_point expiresAt;
    };
    // Drops expired entries; caller holds the unique lock.
    void purgeExpired(clock::time_point now);

    std::unordered_map<std::string, Entry> store;
    mutable std::shared_mutex m;
};

} // namespace svclink

#endif // SVCLINK_CACHE_IN_MEMORY_CACHE_STORE_HPP
