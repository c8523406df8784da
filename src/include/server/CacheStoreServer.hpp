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
#ifndef SVCLINK_SERVER_CACHE_STORE_SERVER_HPP
#define SVCLINK_SERVER_CACHE_STORE_SERVER_HPP

#include "server/CacheStoreServiceImpl.hpp"
#include "cache/CacheStore.hpp"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace svclink {

// Serves a CacheStore over gRPC. The listening address is host:port; port 0
// lets the kernel pick one, and port() reports what was bound.
// Throws std::invalid_argument for an address without a port and
// std::runtime_error when it cannot be bound.
class CacheStoreServer {
public:
    CacheStoreServer(const std::string& listenAddress, CacheStore& store,
                     std::chrono::milliseconds grace = std::chrono::milliseconds{100L});
    ~CacheStoreServer();
    CacheStoreServer(const CacheStoreServer&) = delete;
    CacheStoreServer& operator=(const CacheStoreServer&) = delete;
    CacheStoreServer(CacheStoreServer&&) = delete;
    CacheStoreServer& operator=(CacheStoreServer&&) = delete;

    // In-flight RPCs get the grace period to finish; idempotent.
    void shutdown();
    [[nodiscard]] int port() const;
    // host:port with the bound port, e.g. localhost:41235
    [[nodiscard]] const std::string& address() const;
    [[nodiscard]] bool running() const;
private:
    CacheStoreServiceImpl service;
    std::chrono::milliseconds shutdownGrace;
    int boundPort {0};
    std::string boundAddress;
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
    mutable std::mutex m;
};

} // namespace svclink

#endif // SVCLINK_SERVER_CACHE_STORE_SERVER_HPP
