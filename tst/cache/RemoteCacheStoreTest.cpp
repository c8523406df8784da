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

#include <gtest/gtest.h>
#include "cache/RemoteCacheStore.hpp"
#include "cache/InMemoryCacheStore.hpp"
#include "cache/ResponseCache.hpp"
#include "server/CacheStoreServer.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using svclink::RemoteCacheStore;
using svclink::RemoteCacheStoreConfig;
using svclink::InMemoryCacheStore;
using svclink::CacheStoreServer;
using svclink::ResponseCache;
using svclink::CacheConfig;
using svclink::CircuitBreakerConfig;
using svclink::ErrorCode;
using State = svclink::CircuitBreaker::State;

// Bound then released, so nothing listens there.
std::string deadAddress() {
    InMemoryCacheStore store;
    CacheStoreServer released {"localhost:0", store};
    return released.address();
}

class RemoteCacheStoreTest : public ::testing::Test {
protected:
    InMemoryCacheStore backing;
    std::unique_ptr<CacheStoreServer> server;
    std::unique_ptr<RemoteCacheStore> remote;

    void SetUp() override {
        server = std::make_unique<CacheStoreServer>("localhost:0", backing);
        remote = std::make_unique<RemoteCacheStore>(server->address());
    }

    void TearDown() override {
        remote.reset();
        if (server) {
            server->shutdown();
        }
    }
};

TEST_F(RemoteCacheStoreTest, SetAndGetThroughServer) {
    ASSERT_TRUE(remote->set("key1", "value1", std::chrono::seconds{60}).has_value());
    auto getResult = remote->get("key1");
    ASSERT_TRUE(getResult.has_value());
    ASSERT_TRUE(getResult.value().has_value());
    EXPECT_EQ(getResult.value().value(), "value1");
    EXPECT_EQ(backing.get("key1").value().value(), "value1");
    EXPECT_TRUE(remote->connected());
}

TEST_F(RemoteCacheStoreTest, MissingKeyIsEmpty) {
    auto getResult = remote->get("missing");
    ASSERT_TRUE(getResult.has_value());
    EXPECT_FALSE(getResult.value().has_value());
    EXPECT_EQ(remote->breakerState(), State::Closed);
}

TEST_F(RemoteCacheStoreTest, ScanEraseSizeFlush) {
    ASSERT_TRUE(remote->set("service:a:1", "x", std::chrono::seconds{60}).has_value());
    ASSERT_TRUE(remote->set("service:a:2", "y", std::chrono::seconds{60}).has_value());
    ASSERT_TRUE(remote->set("service:b:1", "z", std::chrono::seconds{60}).has_value());
    EXPECT_EQ(remote->size().value(), 3);

    auto keys = remote->scan("service:a:");
    ASSERT_TRUE(keys.has_value());
    auto found = keys.value();
    std::ranges::sort(found);
    EXPECT_EQ(found, (std::vector<std::string>{"service:a:1", "service:a:2"}));

    auto erased = remote->erase(found);
    ASSERT_TRUE(erased.has_value());
    EXPECT_EQ(erased.value(), 2);
    EXPECT_EQ(remote->size().value(), 1);

    EXPECT_TRUE(remote->flush().has_value());
    EXPECT_EQ(remote->size().value(), 0);
    EXPECT_TRUE(remote->ping().has_value());
}

TEST_F(RemoteCacheStoreTest, StoreErrorsDoNotTripBreaker) {
    for (int i = 0; i < 5; ++i) {
        auto result = remote->set("key1", "value1", std::chrono::seconds{0});
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArg);
    }
    EXPECT_EQ(remote->breakerState(), State::Closed);
}

TEST_F(RemoteCacheStoreTest, OversizedTtlRejectedByServer) {
    auto result = remote->set("key1", "value1", std::chrono::seconds{std::numeric_limits<std::int64_t>::max()});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(backing.size().value(), 0);
    EXPECT_EQ(remote->breakerState(), State::Closed);
    // The server keeps serving.
    EXPECT_TRUE(remote->set("key1", "value1", svclink::maxCacheTtl).has_value());
    EXPECT_TRUE(remote->ping().has_value());
}

TEST_F(RemoteCacheStoreTest, BacksResponseCache) {
    ResponseCache cache {CacheConfig{}, remote.get()};
    ASSERT_TRUE(cache.enabled());
    cache.set("orders", "/api/orders", "GET", {}, nlohmann::json{{"id", 7}});
    auto cached = cache.get("orders", "/api/orders", "GET", {});
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached.value()["id"], 7);
    cache.clear("orders");
    EXPECT_FALSE(cache.get("orders", "/api/orders", "GET", {}).has_value());
}

TEST(CacheStoreServerTest, PortZeroPicksAFreePort) {
    InMemoryCacheStore store;
    CacheStoreServer first {"localhost:0", store};
    CacheStoreServer second {"localhost:0", store};
    EXPECT_GT(first.port(), 0);
    EXPECT_NE(first.port(), second.port());
    EXPECT_EQ(first.address(), "localhost:" + std::to_string(first.port()));
    EXPECT_TRUE(first.running());
    first.shutdown();
    first.shutdown();
    EXPECT_FALSE(first.running());
    EXPECT_TRUE(second.running());
}

TEST(CacheStoreServerTest, PortInUseThrows) {
    InMemoryCacheStore store;
    CacheStoreServer first {"localhost:0", store};
    EXPECT_THROW((CacheStoreServer {first.address(), store}), std::runtime_error);
    EXPECT_THROW((CacheStoreServer {"localhost", store}), std::invalid_argument);
}

TEST(RemoteCacheStoreUnreachableTest, FailuresOpenBreaker) {
    RemoteCacheStoreConfig config;
    config.channelTimeout = std::chrono::milliseconds{50L};
    config.breaker = CircuitBreakerConfig{2, std::chrono::seconds{30}, 1, std::chrono::seconds{10}};
    RemoteCacheStore remote {deadAddress(), config};

    for (int i = 0; i < 2; ++i) {
        auto result = remote.get("key1");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::ServiceUnavailable);
    }
    EXPECT_EQ(remote.breakerState(), State::Open);
    EXPECT_FALSE(remote.available());

    // Open breaker refuses without dialing.
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(remote.ping().has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds{50L});
}

TEST(RemoteCacheStoreUnreachableTest, ResponseCacheDisablesItself) {
    RemoteCacheStoreConfig config;
    config.channelTimeout = std::chrono::milliseconds{50L};
    RemoteCacheStore remote {deadAddress(), config};
    ResponseCache cache {CacheConfig{}, &remote};
    EXPECT_FALSE(cache.enabled());
    EXPECT_FALSE(cache.get("orders", "/api", "GET", {}).has_value());
}
