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
#ifndef SVCLINK_SERVER_CACHE_STORE_SERVICE_IMPL_HPP
#define SVCLINK_SERVER_CACHE_STORE_SERVICE_IMPL_HPP

#include <grpcpp/grpcpp.h>
#include "proto/cacheStore.grpc.pb.h"
#include "cache/CacheStore.hpp"

namespace svclink {

class CacheStoreServiceImpl final : public cacheStore::CacheStoreService::Service {
public:
    explicit CacheStoreServiceImpl(CacheStore& s);
    grpc::Status get(
        grpc::ServerContext* context,
        const cacheStore::GetRequest* request,
        cacheStore::GetReply* reply) override;
    grpc::Status set(
        grpc::ServerContext* context,
        const cacheStore::SetRequest* request,
        cacheStore::SetReply* reply) override;
    grpc::Status scan(
        grpc::ServerContext* context,
        const cacheStore::ScanRequest* request,
        cacheStore::ScanReply* reply) override;
    grpc::Status erase(
        grpc::ServerContext* context,
        const cacheStore::EraseRequest* request,
        cacheStore::EraseReply* reply) override;
    grpc::Status flush(
        grpc::ServerContext* context,
        const cacheStore::FlushRequest* request,
        cacheStore::FlushReply* reply) override;
    grpc::Status size(
        grpc::ServerContext* context,
        const cacheStore::SizeRequest* request,
        cacheStore::SizeReply* reply) override;
    grpc::Status ping(
        grpc::ServerContext* context,
        const cacheStore::PingRequest* request,
        cacheStore::PingReply* reply) override;
private:
    CacheStore& store;
};

} // namespace svclink

#endif // SVCLINK_SERVER_CACHE_STORE_SERVICE_IMPL_HPP
