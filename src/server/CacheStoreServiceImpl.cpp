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
#include "server/CacheStoreServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "cache/CacheStore.hpp"
#include <grpcpp/support/status.h>
#include "proto/cacheStore.pb.h"
#include <chrono>
#include <string>
#include <vector>
#include <tuple>

namespace svclink {

CacheStoreServiceImpl::CacheStoreServiceImpl(CacheStore& s)
    : store {s} {}

grpc::Status CacheStoreServiceImpl::get(
    grpc::ServerContext* context,
    const cacheStore::GetRequest* request,
    cacheStore::GetReply* reply) {
    std::ignore = context;
    auto v = store.get(request->key());
    if (!v.has_value()) {
        return toGrpcStatus(v.error());
    }
    if (!v.value().has_value()) {
        return toGrpcStatus(Error {ErrorCode::KeyNotFound, "key not found"});
    }
    reply->set_value(v.value().value());
    return grpc::Status::OK;
}

grpc::Status CacheStoreServiceImpl::set(
    grpc::ServerContext* context,
    const cacheStore::SetRequest* request,
    cacheStore::SetReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    // Checked before the conversion so an oversized count never reaches clock arithmetic.
    const auto ttl = request->ttlseconds();
    if (ttl <= 0 || ttl > maxCacheTtl.count()) {
        return toGrpcStatus(Error {ErrorCode::InvalidArg, "TTL of " + std::to_string(ttl) + "s is out of range for key " + request->key()});
    }
    return toGrpcStatus(store.set(request->key(), request->value(), std::chrono::seconds{ttl}));
}

grpc::Status CacheStoreServiceImpl::scan(
    grpc::ServerContext* context,
    const cacheStore::ScanRequest* request,
    cacheStore::ScanReply* reply) {
    std::ignore = context;
    auto keys = store.scan(request->prefix());
    if (!keys.has_value()) {
        return toGrpcStatus(keys.error());
    }
    for (const auto& key : keys.value()) {
        reply->add_keys(key);
    }
    return grpc::Status::OK;
}

grpc::Status CacheStoreServiceImpl::erase(
    grpc::ServerContext* context,
    const cacheStore::EraseRequest* request,
    cacheStore::EraseReply* reply) {
    std::ignore = context;
    const std::vector<std::string> keys(request->keys().begin(), request->keys().end());
    auto erased = store.erase(keys);
    if (!erased.has_value()) {
        return toGrpcStatus(erased.error());
    }
    reply->set_erased(erased.value());
    return grpc::Status::OK;
}

grpc::Status CacheStoreServiceImpl::flush(
    grpc::ServerContext* context,
    const cacheStore::FlushRequest* request,
    cacheStore::FlushReply* reply) {
    std::ignore = context;
    std::ignore = request;
    std::ignore = reply;
    return toGrpcStatus(store.flush());
}

grpc::Status CacheStoreServiceImpl::size(
    grpc::ServerContext* context,
    const cacheStore::SizeRequest* request,
    cacheStore::SizeReply* reply) {
    std::ignore = context;
    std::ignore = request;
    auto v = store.size();
    if (!v.has_value()) {
        return toGrpcStatus(v.error());
    }
    reply->set_size(v.value());
    return grpc::Status::OK;
}

grpc::Status CacheStoreServiceImpl::ping(
    grpc::ServerContext* context,
    const cacheStore::PingRequest* request,
    cacheStore::PingReply* reply) {
    std::ignore = context;
    std::ignore = request;
    std::ignore = reply;
    return toGrpcStatus(store.ping());
}

} // namespace svclink
