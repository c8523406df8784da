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
#ifndef SVCLINK_CACHE_REMOTE_CACHE_STORE_HPP
#define SVCLINK_CACHE_REMOTE_CACHE_STORE_HPP

#include "cache/CacheStore.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include <grpcpp/grpcpp.h>
#include "proto/cacheStore.grpc.pb.h"
#include <expected>
#include <memory>
#include <mutex>
#include <chrono>
#include <string>

namespace svclink {

struct RemoteCacheStoreConfig {
    std::chrono::milliseconds rpcTimeout {std::chrono::milliseconds{500}};
    std::chrono::milliseconds channelTimeout {std::chrono::seconds{1}};
    CircuitBreakerConfig breaker {3, std::chrono::seconds{5}, 1, std::chrono::seconds{10}};
};

// CacheStore backed by a CacheStoreService reachable over gRPC.
class RemoteCacheStore : public CacheStore {
public:
    RemoteCacheStore(const std::string& address, const RemoteCacheStoreConfig& c = RemoteCacheStoreConfig{});
    RemoteCacheStore(const RemoteCacheStore&) = delete;
    RemoteCacheStore& operator=(const RemoteCacheStore&) = delete;

    std::expected<std::monostate, Error> connect();
    std::expected<std::optional<std::string>, Error> get(const std::string& key) override;
    std::expected<std::monostate, Error> set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    std::expected<std::vector<std::string>, Error> scan(const std::string& prefix) override;
    std::expected<std::size_t, Error> erase(const std::vector<std::string>& keys) override;
    std::expected<std::monostate, Error> flush() override;
    std::expected<std::size_t, Error> size() override;
    std::expected<std::monostate, Error> ping() override;

    [[nodiscard]] bool available();
    [[nodiscard]] bool connected() const;
    [[nodiscard]] std::string address() const;
    [[nodiscard]] CircuitBreaker::State breakerState() const;
private:
    template<typename Req, typename Rep>
    std::expected<std::monostate, Error> call(
        grpc::Status (cacheStore::CacheStoreService::Stub::* f)(grpc::ClientContext*, const Req&, Rep*),
        const Req& request,
        Rep& reply) {
        if (!available()) {
            return std::unexpected {Error::serviceUnavailable("cache-store", "not reachable @" + addr)};
        }
        std::shared_ptr<cacheStore::CacheStoreService::Stub> s;
        {
            std::lock_guard lock {m};
            s = stub;
        }
        grpc::ClientContext c;
        c.set_deadline(std::chrono::system_clock::now() + config.rpcTimeout);
        auto status = (s.get()->*f)(&c, request, &reply);
        if (status.ok()) {
            circuitBreaker.recordSuccess();
            return {};
        }
        auto error = toError(status);
        // Application errors from the store say nothing about its health.
        if (error.code == ErrorCode::ServiceUnavailable || error.code == ErrorCode::Timeout) {
            circuitBreaker.recordFailure();
        }
        return std::unexpected {error};
    }

    const std::string addr;
    const RemoteCacheStoreConfig config;
    CircuitBreaker circuitBreaker;
    mutable std::mutex m;
    std::shared_ptr<grpc::Channel> channel;
    std::shared_ptr<cacheStore::CacheStoreService::Stub> stub;
};

} // namespace svclink

#endif // SVCLINK_CACHE_REMOTE_CACHE_STORE_HPP
