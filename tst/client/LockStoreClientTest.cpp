// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZLOCK a distributed mutual-exclusion lock over a shared key-value store.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */


#include <gtest/gtest.h>
#include "client/Config.hpp"
#include "client/LockStoreClient.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Error.hpp"
#include "lock/Lock.hpp"
#include "lock/LockKeys.hpp"
#include "lock/LockOptions.hpp"
#include "lock/Reset.hpp"
#include "server/LockStoreServiceImpl.hpp"
#include "storage/InMemoryLockStore.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using zlock::Config;
using zlock::RetryPolicy;
using zlock::InMemoryLockStore;
using zlock::LockStoreServiceImpl;
using zlock::LockStoreServer;
using zlock::LockStoreClient;
using zlock::Lock;
using zlock::LockKeys;
using zlock::LockOptions;
using zlock::Key;
using zlock::ErrorCode;
using namespace std::chrono_literals;

class LockStoreClientTest : public ::testing::Test {
protected:
    const std::string serverAddr = "localhost:50062";
    RetryPolicy policy{std::chrono::microseconds{100L}, std::chrono::microseconds{1000L}, std::chrono::microseconds{5000L}, 3, 1, std::chrono::milliseconds{1000L}, std::chrono::milliseconds{200L}};
    InMemoryLockStore store;
    LockStoreServiceImpl serviceImpl{store};
    std::unique_ptr<LockStoreServer> server;
    std::unique_ptr<Config> config;
    std::unique_ptr<LockStoreClient> client;

    void SetUp() override {
        server = std::make_unique<LockStoreServer>(serverAddr, serviceImpl);
        std::this_thread::sleep_for(std::chrono::milliseconds{200L});
        config = std::make_unique<Config>(serverAddr, policy);
        client = std::make_unique<LockStoreClient>(*config);
    }

    void TearDown() override {
        client.reset();
        config.reset();
        if (server) {
            server->shutdown();
        }
    }
};

TEST_F(LockStoreClientTest, Primitives) {
    const Key key{"lock:foo"};
    auto set = client->setIfAbsent(key, "owner", std::nullopt);
    ASSERT_TRUE(set.has_value());
    EXPECT_TRUE(set.value());
    EXPECT_FALSE(client->setIfAbsent(key, "other", std::nullopt).value());
    EXPECT_EQ(client->get(key).value(), std::optional<std::string>{"owner"});
    EXPECT_FALSE(client->get(Key{"lock:none"}).value().has_value());
    EXPECT_FALSE(client->expireIfEquals(key, "other", 1000ms).value());
    EXPECT_TRUE(client->expireIfEquals(key, "owner", 1000ms).value());
    EXPECT_TRUE(store.ttl(key).has_value());
    EXPECT_FALSE(client->eraseIfEquals(key, "other").value());
    EXPECT_TRUE(client->eraseIfEquals(key, "owner").value());
    EXPECT_FALSE(client->erase(key).value());
    EXPECT_EQ(client->size().value(), 0U);
}

TEST_F(LockStoreClientTest, NotifyAndBlockingPop) {
    const Key channel{"lock-signal:foo"};
    ASSERT_TRUE(client->notify(channel, "1", 1000ms).has_value());
    ASSERT_TRUE(client->notify(channel, "1", 1000ms).has_value());
    EXPECT_EQ(store.length(channel), 1U);
    auto popped = client->blockingPop(channel, 100ms);
    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(popped.value(), std::optional<std::string>{"1"});
    auto empty = client->blockingPop(channel, 200ms);
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty.value().has_value());
}

TEST_F(LockStoreClientTest, BlockingPopLongerThanRpcTimeout) {
    const Key channel{"lock-signal:foo"};
    std::thread notifier([this, &channel] {
        std::this_thread::sleep_for(1500ms);
        EXPECT_TRUE(store.notify(channel, "1", 1000ms).has_value());
    });
    auto popped = client->blockingPop(channel, 3000ms);
    notifier.join();
    ASSERT_TRUE(popped.has_value());
    EXPECT_TRUE(popped.value().has_value());
}

TEST_F(LockStoreClientTest, KeysByPrefix) {
    ASSERT_TRUE(client->setIfAbsent(Key{"lock:a"}, "1", std::nullopt).value());
    ASSERT_TRUE(client->setIfAbsent(Key{"lock:b"}, "1", std::nullopt).value());
    ASSERT_TRUE(client->setIfAbsent(Key{"other"}, "1", std::nullopt).value());
    auto keys = client->keys("lock:");
    ASSERT_TRUE(keys.has_value());
    EXPECT_EQ(keys.value().size(), 2U);
}

TEST_F(LockStoreClientTest, WrongTypeIsNotRetried) {
    ASSERT_TRUE(client->notify(Key{"lock-signal:foo"}, "1", 1000ms).has_value());
    auto got = client->get(Key{"lock-signal:foo"});
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ErrorCode::WrongType);
}

TEST_F(LockStoreClientTest, UnreachableStore) {
    Config unreachable{"localhost:59997", policy};
    LockStoreClient lost{unreachable};
    auto got = lost.get(Key{"lock:foo"});
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ErrorCode::ServiceTemporarilyUnavailable);
    Lock lock{lost, "foo"};
    auto acquired = lock.acquire(false);
    ASSERT_FALSE(acquired.has_value());
    EXPECT_EQ(acquired.error().code, ErrorCode::ServiceTemporarilyUnavailable);
}

TEST_F(LockStoreClientTest, DownStoreIsNeverReplacedByAnother) {
    const std::string otherAddr = "localhost:50065";
    InMemoryLockStore otherStore;
    LockStoreServiceImpl otherImpl{otherStore};
    LockStoreServer other{otherAddr, otherImpl};

    Lock first{*client, "foo"};
    ASSERT_TRUE(first.acquire(false).value());
    server->shutdown();
    server.reset();

    Config secondConfig{serverAddr, policy};
    LockStoreClient secondClient{secondConfig};
    Lock second{secondClient, "foo"};
    auto acquired = second.acquire(false);
    ASSERT_FALSE(acquired.has_value());
    EXPECT_EQ(acquired.error().code, ErrorCode::ServiceTemporarilyUnavailable);
    EXPECT_EQ(otherStore.size().value(), 0U);
    EXPECT_EQ(store.get(LockKeys::forName("foo").holder).value(), std::optional<std::string>{first.id()});
    other.shutdown();
}

TEST_F(LockStoreClientTest, LockOverRemoteStore) {
    Lock a{*client, "foo"};
    Lock b{*client, "foo"};
    ASSERT_TRUE(a.acquire().value());
    EXPECT_FALSE(b.acquire(false).value());
    EXPECT_EQ(store.get(LockKeys::forName("foo").holder).value(), std::optional<std::string>{a.id()});
    ASSERT_TRUE(a.release().has_value());
    EXPECT_TRUE(b.acquire(false).value());
    ASSERT_TRUE(b.release().has_value());
}

TEST_F(LockStoreClientTest, RemoteWaiterWakesOnRelease) {
    Lock a{*client, "foo"};
    Lock b{*client, "foo"};
    ASSERT_TRUE(a.acquire().value());
    std::thread releaser([&a] {
        std::this_thread::sleep_for(300ms);
        EXPECT_TRUE(a.release().has_value());
    });
    auto start = std::chrono::steady_clock::now();
    auto acquired = b.acquire(true, 5s);
    releaser.join();
    ASSERT_TRUE(acquired.has_value());
    EXPECT_TRUE(acquired.value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    ASSERT_TRUE(b.release().has_value());
}

TEST_F(LockStoreClientTest, RemoteAutoRenewal) {
    LockOptions options;
    options.expire = 1s;
    options.autoRenewal = true;
    Lock a{*client, "foo", options};
    ASSERT_TRUE(a.acquire().value());
    std::this_thread::sleep_for(2500ms);
    EXPECT_TRUE(a.locked().value());
    EXPECT_TRUE(a.renewing());
    ASSERT_TRUE(a.release().has_value());
    EXPECT_FALSE(a.renewing());
}

TEST_F(LockStoreClientTest, RemoteMutualExclusion) {
    constexpr int threads = 4;
    constexpr int rounds = 10;
    std::atomic<int> inside{0};
    std::atomic<int> violations{0};
    int counter = 0;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            Lock lock{*client, "counter"};
            for (int r = 0; r < rounds; ++r) {
                auto acquired = lock.acquire(true, 20s);
                if (!acquired.has_value() || !acquired.value()) {
                    ++violations;
                    continue;
                }
                if (inside.fetch_add(1) != 0) {
                    ++violations;
                }
                ++counter;
                inside.fetch_sub(1);
                if (!lock.release().has_value()) {
                    ++violations;
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(counter, threads * rounds);
}

TEST_F(LockStoreClientTest, ResetAllOverRemoteStore) {
    Lock a{*client, "a"};
    Lock b{*client, "b"};
    ASSERT_TRUE(a.acquire().value());
    ASSERT_TRUE(b.acquire().value());
    ASSERT_TRUE(zlock::resetAll(*client, 1000ms).has_value());
    EXPECT_FALSE(a.locked().value());
    EXPECT_FALSE(b.locked().value());
}
