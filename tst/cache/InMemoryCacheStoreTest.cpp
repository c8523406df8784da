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
#include "cache/InMemoryCacheStore.hpp"
#include "common/Error.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using svclink::InMemoryCacheStore;
using svclink::ErrorCode;

class InMemoryCacheStoreTest : public ::testing::Test {
protected:
    InMemoryCacheStore store;
    const std::chrono::seconds ttl {60};
};

TEST_F(InMemoryCacheStoreTest, SetAndGetBasic) {
    auto setResult = store.set("key1", "value1", ttl);
    EXPECT_TRUE(setResult.has_value());
    auto getResult = store.get("key1");
    ASSERT_TRUE(getResult.has_value());
    ASSERT_TRUE(getResult.value().has_value());
    EXPECT_EQ(getResult.value().value(), "value1");
}

TEST_F(InMemoryCacheStoreTest, GetNonExistentKey) {
    auto getResult = store.get("missing");
    ASSERT_TRUE(getResult.has_value());
    EXPECT_FALSE(getResult.value().has_value());
}

TEST_F(InMemoryCacheStoreTest, OverwriteValue) {
    ASSERT_TRUE(store.set("key1", "value1", ttl).has_value());
    ASSERT_TRUE(store.set("key1", "value2", ttl).has_value());
    auto getResult = store.get("key1");
    ASSERT_TRUE(getResult.has_value());
    ASSERT_TRUE(getResult.value().has_value());
    EXPECT_EQ(getResult.value().value(), "value2");
    EXPECT_EQ(store.size().value(), 1);
}

TEST_F(InMemoryCacheStoreTest, NonPositiveTtlRejected) {
    auto result = store.set("key1", "value1", std::chrono::seconds{0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(store.size().value(), 0);
}

TEST_F(InMemoryCacheStoreTest, OversizedTtlRejected) {
    auto huge = store.set("k", "v", std::chrono::seconds{std::numeric_limits<std::int64_t>::max()});
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error().code, ErrorCode::InvalidArg);
    EXPECT_FALSE(store.get("k").value().has_value());
    EXPECT_TRUE(store.set("k", "v", svclink::maxCacheTtl).has_value());
    EXPECT_EQ(store.get("k").value().value(), "v");
}

TEST_F(InMemoryCacheStoreTest, EntriesExpire) {
    ASSERT_TRUE(store.set("short", "v", std::chrono::seconds{1}).has_value());
    ASSERT_TRUE(store.set("long", "v", ttl).has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds{1100L});
    auto getResult = store.get("short");
    ASSERT_TRUE(getResult.has_value());
    EXPECT_FALSE(getResult.value().has_value());
    EXPECT_EQ(store.scan("").value(), std::vector<std::string>{"long"});
    EXPECT_EQ(store.size().value(), 1);
}

TEST_F(InMemoryCacheStoreTest, ScanByPrefix) {
    ASSERT_TRUE(store.set("service:orders:endpoint:/a:1", "x", ttl).has_value());
    ASSERT_TRUE(store.set("service:orders:endpoint:/b:2", "y", ttl).has_value());
    ASSERT_TRUE(store.set("service:ordersarchive:endpoint:/a:3", "z", ttl).has_value());
    auto keys = store.scan("service:orders:");
    ASSERT_TRUE(keys.has_value());
    auto found = keys.value();
    std::ranges::sort(found);
    EXPECT_EQ(found, (std::vector<std::string>{"service:orders:endpoint:/a:1", "service:orders:endpoint:/b:2"}));
}

TEST_F(InMemoryCacheStoreTest, EraseCountsRemovedKeys) {
    ASSERT_TRUE(store.set("a", "1", ttl).has_value());
    ASSERT_TRUE(store.set("b", "2", ttl).has_value());
    auto erased = store.erase({"a", "b", "c"});
    ASSERT_TRUE(erased.has_value());
    EXPECT_EQ(erased.value(), 2);
    EXPECT_EQ(store.size().value(), 0);
}

TEST_F(InMemoryCacheStoreTest, FlushEmptiesStore) {
    ASSERT_TRUE(store.set("a", "1", ttl).has_value());
    ASSERT_TRUE(store.set("b", "2", ttl).has_value());
    EXPECT_TRUE(store.flush().has_value());
    EXPECT_EQ(store.size().value(), 0);
    EXPECT_TRUE(store.ping().has_value());
}

TEST_F(InMemoryCacheStoreTest, ConcurrentWriters) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 100; ++i) {
                EXPECT_TRUE(store.set("k" + std::to_string(t) + "-" + std::to_string(i), "v", ttl).has_value());
                EXPECT_TRUE(store.get("k" + std::to_string(t) + "-" + std::to_string(i)).has_value());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(store.size().value(), 800);
}
