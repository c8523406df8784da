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
#ifndef SVCLINK_CACHE_CACHE_STORE_HPP
#define SVCLINK_CACHE_CACHE_STORE_HPP

#include "common/Error.hpp"
#include <expected>
#include <optional>
#include <variant>
#include <string>
#include <vector>
#include <chrono>
#include <cstddef>

namespace svclink {

// Longest TTL a store accepts; keeps expiry arithmetic on steady_clock in range.
inline constexpr std::chrono::seconds maxCacheTtl {std::chrono::days{365}};

class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::expected<std::optional<std::string>, Error> get(const std::string& key) = 0;
    // ttl must lie in (0, maxCacheTtl].
    virtual std::expected<std::monostate, Error> set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    // Keys starting with prefix; an empty prefix matches every key.
    virtual std::expected<std::vector<std::string>, Error> scan(const std::string& prefix) = 0;
    // Returns the number of keys actually removed.
    virtual std::expected<std::size_t, Error> erase(const std::vector<std::string>& keys) = 0;
    virtual std::expected<std::monostate, Error> flush() = 0;
    virtual std::expected<std::size_t, Error> size() = 0;
    virtual std::expected<std::monostate, Error> ping() = 0;
};

} // namespace svclink

#endif // SVCLINK_CACHE_CACHE_STORE_HPP
