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
#include "cache/InMemoryCacheStore.hpp"
#include <expected>
#include <string>
#include <shared_mutex>
#include <mutex>
#include <cstddef>
#include <optional>
#include <variant>
#include <vector>
#include "common/Error.hpp"

namespace svclink {

InMemoryCacheStore::InMemoryCacheStore() : store{}, m{} {}

std::expected<std::optional<std::string>, Error> InMemoryCacheStore::get(const std::string& key) {
    const std::shared_lock lock {m};
    auto i = store.find(key);
    if (i == store.end() || i->second.expiresAt <= clock::now()) {
        return std::nullopt;
    }
    return i->second.value;
}

std::expected<std::monostate, Error> InMemoryCacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    if (ttl <= std::chrono::seconds::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "TTL must be positive for key " + key}};
    }
    if (ttl > maxCacheTtl) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "TTL of " + std::to_string(ttl.count()) + "s is too long for key " + key}};
    }
    const std::unique_lock lock {m};
    const auto now = clock::now();
    purgeExpired(now);
    store.insert_or_assign(key, Entry {value, now + ttl});
    return {};
}

std::expected<std::vector<std::string>, Error> InMemoryCacheStore::scan(const std::string& prefix) {
    const std::shared_lock lock {m};
    const auto now = clock::now();
    std::vector<std::string> keys;
    for (const auto& [key, entry] : store) {
        if (entry.expiresAt > now && key.starts_with(prefix)) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::expected<std::size_t, Error> InMemoryCacheStore::erase(const std::vector<std::string>& keys) {
    const std::unique_lock lock {m};
    purgeExpired(clock::now());
    std::size_t erased = 0;
    for (const auto& key : keys) {
        erased += store.erase(key);
    }
    return erased;
}

std::expected<std::monostate, Error> InMemoryCacheStore::flush() {
    const std::unique_lock lock {m};
    store.clear();
    return {};
}

std::expected<std::size_t, Error> InMemoryCacheStore::size() {
    const std::unique_lock lock {m};
    purgeExpired(clock::now());
    return store.size();
}

std::expected<std::monostate, Error> InMemoryCacheStore::ping() {
    return {};
}

void InMemoryCacheStore::purgeExpired(clock::time_point now) {
    std::erase_if(store, [now](const auto& item) { return item.second.expiresAt <= now; });
}

} // namespace svclink
