#include "cache/RemoteCacheStore.hpp"

#include <chrono>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include "common/Error.hpp"
#include <grpcpp/grpcpp.h>
#include "proto/cacheStore.grpc.pb.h"
#include "proto/cacheStore.pb.h"
#include <grpcpp/security/credentials.h>

namespace svclink {

RemoteCacheStore::RemoteCacheStore(const std::string& address, const RemoteCacheStoreConfig& c)
    : addr {address},
      config {c},
      circuitBreaker {"cache-store-circuit", c.breaker} {}

std::expected<std::monostate, Error> RemoteCacheStore::connect() {
    std::lock_guard lock {m};
    // If we already have a channel, check if it's usable
    if (channel) {
        auto state = channel->GetState(false);
        if (state == GRPC_CHANNEL_READY || state == GRPC_CHANNEL_IDLE || state == GRPC_CHANNEL_CONNECTING) {
            if (state == GRPC_CHANNEL_READY) {
                if (!stub) {
                    stub = cacheStore::CacheStoreService::NewStub(channel);
                }
                spdlog::debug("Cache store @ {} already connected", addr);
                return {};
            }
            if (channel->WaitForConnected(std::chrono::system_clock::now() + config.channelTimeout)) {
                if (!stub) {
                    stub = cacheStore::CacheStoreService::NewStub(channel);
                }
                spdlog::info("Reconnected to cache store @ {}", addr);
                return {};
            }
        }
        // TRANSIENT_FAILURE or SHUTDOWN, recreate
    }

    channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + config.channelTimeout)) {
        spdlog::warn("Could not connect to cache store @ {}", addr);
        return std::unexpected {Error::serviceUnavailable("cache-store", "could not connect @" + addr)};
    }
    stub = cacheStore::CacheStoreService::NewStub(channel);
    spdlog::info("Connected to cache store @ {}", addr);
    return {};
}

bool RemoteCacheStore::available() {
    if (!circuitBreaker.canExecute()) {
        return false;
    }
    if (!connected()) {
        auto result = connect();
        if (!result.has_value()) {
            circuitBreaker.recordFailure();
            return false;
        }
    }
    return true;
}

bool RemoteCacheStore::connected() const {
    std::lock_guard lock {m};
    return channel && stub && channel->GetState(true) == grpc_connectivity_state::GRPC_CHANNEL_READY;
}

std::string RemoteCacheStore::address() const {
    return addr;
}

CircuitBreaker::State RemoteCacheStore::breakerState() const {
    return circuitBreaker.state();
}

std::expected<std::optional<std::string>, Error> RemoteCacheStore::get(const std::string& key) {
    cacheStore::GetRequest request;
    request.set_key(key);
    cacheStore::GetReply reply;
    auto result = call(&cacheStore::CacheStoreService::Stub::get, request, reply);
    if (!result.has_value()) {
        if (result.error().code == ErrorCode::KeyNotFound) {
            return std::nullopt;
        }
        return std::unexpected {result.error()};
    }
    return reply.value();
}

std::expected<std::monostate, Error> RemoteCacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    cacheStore::SetRequest request;
    request.set_key(key);
    request.set_value(value);
    request.set_ttlseconds(ttl.count());
    cacheStore::SetReply reply;
    return call(&cacheStore::CacheStoreService::Stub::set, request, reply);
}

std::expected<std::vector<std::string>, Error> RemoteCacheStore::scan(const std::string& prefix) {
    cacheStore::ScanRequest request;
    request.set_prefix(prefix);
    cacheStore::ScanReply reply;
    auto result = call(&cacheStore::CacheStoreService::Stub::scan, request, reply);
    if (!result.has_value()) {
        return std::unexpected {result.error()};
    }
    return std::vector<std::string>(reply.keys().begin(), reply.keys().end());
}

std::expected<std::size_t, Error> RemoteCacheStore::erase(const std::vector<std::string>& keys) {
    cacheStore::EraseRequest request;
    for (const auto& key : keys) {
        request.add_keys(key);
    }
    cacheStore::EraseReply reply;
    auto result = call(&cacheStore::CacheStoreService::Stub::erase, request, reply);
    if (!result.has_value()) {
        return std::unexpected {result.error()};
    }
    return static_cast<std::size_t>(reply.erased());
}

std::expected<std::monostate, Error> RemoteCacheStore::flush() {
    cacheStore::FlushRequest request;
    cacheStore::FlushReply reply;
    return call(&cacheStore::CacheStoreService::Stub::flush, request, reply);
}

std::expected<std::size_t, Error> RemoteCacheStore::size() {
    cacheStore::SizeRequest request;
    cacheStore::SizeReply reply;
    auto result = call(&cacheStore::CacheStoreService::Stub::size, request, reply);
    if (!result.has_value()) {
        return std::unexpected {result.error()};
    }
    return static_cast<std::size_t>(reply.size());
}

std::expected<std::monostate, Error> RemoteCacheStore::ping() {
    cacheStore::PingRequest request;
    cacheStore::PingReply reply;
    return call(&cacheStore::CacheStoreService::Stub::ping, request, reply);
}

} // namespace svclink
