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
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <string>
#include <algorithm>
#include "storage/InMemoryLockStore.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"

using zlock::InMemoryLockStore;
using zlock::Key;
using zlock::ErrorCode;
using namespace std::chrono_literals;

class InMemoryLockStoreTest : public ::testing::Test {
protected:
    InMemoryLockStore store;
    const Key key {"lock:foo"};
    const Key channel {"lock-signal:foo"};
};

TEST_F(InMemoryLockStoreTest, StartsEmpty) {
    EXPECT_EQ(store.size().value(), 0U);
    EXPECT_FALSE(store.get(key).value().has_value());
}

TEST_F(InMemoryLockStoreTest, SetIfAbsentOnlyOnce) {
    EXPECT_TRUE(store.setIfAbsent(key, "a", std::nullopt).value());
    EXPECT_FALSE(store.setIfAbsent(key, "b", std::nullopt).value());
    EXPECT_EQ(store.get(key).value(), "a");
    EXPECT_EQ(store.size().value(), 1U);
    EXPECT_FALSE(store.ttl(key).has_value());
}

TEST_F(InMemoryLockStoreTest, ExpiredKeyIsAbsent) {
    EXPECT_TRUE(store.setIfAbsent(key, "a", 50ms).value());
    auto ttl = store.ttl(key);
    ASSERT_TRUE(ttl.has_value());
    EXPECT_LE(ttl.value(), 50ms);
    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(store.get(key).value().has_value());
    EXPECT_EQ(store.size().value(), 0U);
    EXPECT_FALSE(store.eraseIfEquals(key, "a").value());
    EXPECT_TRUE(store.setIfAbsent(key, "b", std::nullopt).value());
    EXPECT_EQ(store.get(key).value(), "b");
}

TEST_F(InMemoryLockStoreTest, EraseIfEqualsComparesValue) {
    ASSERT_TRUE(store.setIfAbsent(key, "a", std::nullopt).value());
    EXPECT_FALSE(store.eraseIfEquals(key, "b").value());
    EXPECT_EQ(store.get(key).value(), "a");
    EXPECT_TRUE(store.eraseIfEquals(key, "a").value());
    EXPECT_FALSE(store.get(key).value().has_value());
    EXPECT_FALSE(store.eraseIfEquals(key, "a").value());
}

TEST_F(InMemoryLockStoreTest, ExpireIfEqualsComparesValue) {
    ASSERT_TRUE(store.setIfAbsent(key, "a", 100ms).value());
    EXPECT_FALSE(store.expireIfEquals(key, "b", 10s).value());
    EXPECT_LE(store.ttl(key).value(), 100ms);
    EXPECT_TRUE(store.expireIfEquals(key, "a", 10s).value());
    EXPECT_GT(store.ttl(key).value(), 9s);
    EXPECT_FALSE(store.expireIfEquals(Key{"lock:missing"}, "a", 10s).value());
}

TEST_F(InMemoryLockStoreTest, ExpireIfEqualsGivesPersistentKeyATtl) {
    ASSERT_TRUE(store.setIfAbsent(key, "a", std::nullopt).value());
    EXPECT_TRUE(store.expireIfEquals(key, "a", 50ms).value());
    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(store.get(key).value().has_value());
}

TEST_F(InMemoryLockStoreTest, NotifyReplacesTheList) {
    ASSERT_TRUE(store.notify(channel, "1", 1s).has_value());
    ASSERT_TRUE(store.notify(channel, "1", 1s).has_value());
    ASSERT_TRUE(store.notify(channel, "2", 1s).has_value());
    EXPECT_EQ(store.length(channel), 1U);
    auto popped = store.blockingPop(channel, 0ms);
    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(popped.value(), "2");
    EXPECT_EQ(store.length(channel), 0U);
    EXPECT_EQ(store.size().value(), 0U);
}

TEST_F(InMemoryLockStoreTest, NotifyTokenExpires) {
    ASSERT_TRUE(store.notify(channel, "1", 50ms).has_value());
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(store.length(channel), 0U);
    EXPECT_FALSE(store.blockingPop(channel, 0ms).value().has_value());
}

TEST_F(InMemoryLockStoreTest, BlockingPopTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto popped = store.blockingPop(channel, 100ms);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(popped.has_value());
    EXPECT_FALSE(popped.value().has_value());
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 1s);
}

TEST_F(InMemoryLockStoreTest, BlockingPopWakesOnNotify) {
    std::thread notifier([this] {
        std::this_thread::sleep_for(50ms);
        ASSERT_TRUE(store.notify(channel, "1", 1s).has_value());
    });
    auto start = std::chrono::steady_clock::now();
    auto popped = store.blockingPop(channel, 5s);
    auto elapsed = std::chrono::steady_clock::now() - start;
    notifier.join();
    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(popped.value(), "1");
    EXPECT_LT(elapsed, 2s);
}

TEST_F(InMemoryLockStoreTest, OneTokenWakesOneWaiter) {
    std::atomic<int> woken {0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([this, &woken] {
            auto popped = store.blockingPop(channel, 300ms);
            if (popped.has_value() && popped.value().has_value()) {
                ++woken;
            }
        });
    }
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(store.notify(channel, "1", 1s).has_value());
    for (auto& t : waiters) {
        t.join();
    }
    EXPECT_EQ(woken.load(), 1);
}

TEST_F(InMemoryLockStoreTest, WrongTypeIsReported) {
    ASSERT_TRUE(store.notify(channel, "1", 1s).has_value());
    auto got = store.get(channel);
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ErrorCode::WrongType);
    ASSERT_TRUE(store.setIfAbsent(key, "a", std::nullopt).value());
    auto popped = store.blockingPop(key, 0ms);
    ASSERT_FALSE(popped.has_value());
    EXPECT_EQ(popped.error().code, ErrorCode::WrongType);
}

TEST_F(InMemoryLockStoreTest, EraseAnyType) {
    ASSERT_TRUE(store.setIfAbsent(key, "a", std::nullopt).value());
    ASSERT_TRUE(store.notify(channel, "1", 1s).has_value());
    EXPECT_TRUE(store.erase(key).value());
    EXPECT_TRUE(store.erase(channel).value());
    EXPECT_FALSE(store.erase(key).value());
    EXPECT_EQ(store.size().value(), 0U);
}

TEST_F(InMemoryLockStoreTest, KeysByPrefix) {
    ASSERT_TRUE(store.setIfAbsent(Key{"lock:a"}, "1", std::nullopt).value());
    ASSERT_TRUE(store.setIfAbsent(Key{"lock:b"}, "1", std::nullopt).value());
    ASSERT_TRUE(store.setIfAbsent(Key{"lock:gone"}, "1", 1ms).value());
    ASSERT_TRUE(store.notify(Key{"lock-signal:a"}, "1", 1s).has_value());
    ASSERT_TRUE(store.setIfAbsent(Key{"other"}, "1", std::nullopt).value());
    std::this_thread::sleep_for(10ms);
    auto keys = store.keys("lock:").value();
    std::vector<std::string> names;
    for (const auto& k : keys) {
        names.push_back(k.data);
    }
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"lock:a", "lock:b"}));
}

TEST_F(InMemoryLockStoreTest, ConcurrentSetIfAbsentHasOneWinner) {
    std::atomic<int> winners {0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([this, i, &winners] {
            if (store.setIfAbsent(key, std::to_string(i), std::nullopt).value()) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
}
