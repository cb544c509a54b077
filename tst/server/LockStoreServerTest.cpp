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
#include <grpcpp/grpcpp.h>
#include "server/LockStoreServiceImpl.hpp"
#include "storage/InMemoryLockStore.hpp"
#include "proto/lockStore.grpc.pb.h"
#include "proto/lockStore.pb.h"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include <thread>
#include <chrono>
#include <string>
#include <memory>
#include <grpcpp/support/status.h>
#include <grpcpp/security/credentials.h>

using zlock::InMemoryLockStore;
using zlock::LockStoreServiceImpl;
using zlock::LockStoreServer;
using zlock::ErrorCode;
using zlock::lockStore::LockStoreService;
using zlock::lockStore::SetIfAbsentRequest;
using zlock::lockStore::SetIfAbsentReply;
using zlock::lockStore::GetRequest;
using zlock::lockStore::GetReply;
using zlock::lockStore::EraseIfEqualsRequest;
using zlock::lockStore::EraseIfEqualsReply;
using zlock::lockStore::NotifyRequest;
using zlock::lockStore::NotifyReply;
using zlock::lockStore::BlockingPopRequest;
using zlock::lockStore::BlockingPopReply;
using zlock::lockStore::KeysRequest;
using zlock::lockStore::KeysReply;
using zlock::lockStore::SizeRequest;
using zlock::lockStore::SizeReply;

const std::string SERVER_ADDR = "localhost:50061";

class LockStoreServerTest : public ::testing::Test {
protected:
    InMemoryLockStore store;
    LockStoreServiceImpl serviceImpl{store};
    std::unique_ptr<LockStoreServer> server;
    std::unique_ptr<LockStoreService::Stub> stub;

    void SetUp() override {
        server = std::make_unique<LockStoreServer>(SERVER_ADDR, serviceImpl);
        auto channel = grpc::CreateChannel(SERVER_ADDR, grpc::InsecureChannelCredentials());
        ASSERT_TRUE(channel->WaitForConnected(std::chrono::system_clock::now() + std::chrono::seconds{2L}));
        stub = LockStoreService::NewStub(channel);
    }

    void TearDown() override {
        if (server) {
            server->shutdown();
        }
    }

    bool setIfAbsent(const std::string& key, const std::string& value, std::uint64_t ttlMs = 0) {
        SetIfAbsentRequest req;
        req.mutable_key()->set_data(key);
        req.set_value(value);
        req.set_ttlms(ttlMs);
        SetIfAbsentReply rep;
        grpc::ClientContext ctx;
        EXPECT_TRUE(stub->setIfAbsent(&ctx, req, &rep).ok());
        return rep.set();
    }
};

TEST_F(LockStoreServerTest, SetIfAbsentAndGet) {
    EXPECT_TRUE(setIfAbsent("lock:foo", "owner"));
    EXPECT_FALSE(setIfAbsent("lock:foo", "other"));

    GetRequest req;
    req.mutable_key()->set_data("lock:foo");
    GetReply rep;
    grpc::ClientContext ctx;
    ASSERT_TRUE(stub->get(&ctx, req, &rep).ok());
    EXPECT_TRUE(rep.found());
    EXPECT_EQ(rep.value(), "owner");
}

TEST_F(LockStoreServerTest, GetMissingIsNotAnError) {
    GetRequest req;
    req.mutable_key()->set_data("lock:missing");
    GetReply rep;
    grpc::ClientContext ctx;
    ASSERT_TRUE(stub->get(&ctx, req, &rep).ok());
    EXPECT_FALSE(rep.found());
}

TEST_F(LockStoreServerTest, TtlIsApplied) {
    EXPECT_TRUE(setIfAbsent("lock:foo", "owner", 50));
    std::this_thread::sleep_for(std::chrono::milliseconds{100L});
    EXPECT_TRUE(setIfAbsent("lock:foo", "other"));
}

TEST_F(LockStoreServerTest, EraseIfEquals) {
    ASSERT_TRUE(setIfAbsent("lock:foo", "owner"));
    EraseIfEqualsRequest req;
    req.mutable_key()->set_data("lock:foo");
    req.set_expected("other");
    EraseIfEqualsReply rep;
    grpc::ClientContext ctx1;
    ASSERT_TRUE(stub->eraseIfEquals(&ctx1, req, &rep).ok());
    EXPECT_FALSE(rep.erased());
    req.set_expected("owner");
    grpc::ClientContext ctx2;
    ASSERT_TRUE(stub->eraseIfEquals(&ctx2, req, &rep).ok());
    EXPECT_TRUE(rep.erased());
}

TEST_F(LockStoreServerTest, WrongTypeCarriesDetails) {
    NotifyRequest notify;
    notify.mutable_key()->set_data("lock-signal:foo");
    notify.set_token("1");
    notify.set_ttlms(1000);
    NotifyReply notified;
    grpc::ClientContext ctx1;
    ASSERT_TRUE(stub->notify(&ctx1, notify, &notified).ok());

    GetRequest req;
    req.mutable_key()->set_data("lock-signal:foo");
    GetReply rep;
    grpc::ClientContext ctx2;
    auto status = stub->get(&ctx2, req, &rep);
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    auto error = zlock::toError(status);
    EXPECT_EQ(error.code, ErrorCode::WrongType);
    EXPECT_EQ(error.key, "lock-signal:foo");
}

TEST_F(LockStoreServerTest, BlockingPopWaitsForNotify) {
    std::thread notifier([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds{100L});
        NotifyRequest req;
        req.mutable_key()->set_data("lock-signal:foo");
        req.set_token("1");
        req.set_ttlms(1000);
        NotifyReply rep;
        grpc::ClientContext ctx;
        EXPECT_TRUE(stub->notify(&ctx, req, &rep).ok());
    });
    BlockingPopRequest req;
    req.mutable_key()->set_data("lock-signal:foo");
    req.set_timeoutms(5000);
    BlockingPopReply rep;
    grpc::ClientContext ctx;
    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(stub->blockingPop(&ctx, req, &rep).ok());
    notifier.join();
    EXPECT_TRUE(rep.popped());
    EXPECT_EQ(rep.value(), "1");
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{2L});
}

TEST_F(LockStoreServerTest, BlockingPopIsBoundedByDeadline) {
    BlockingPopRequest req;
    req.mutable_key()->set_data("lock-signal:foo");
    req.set_timeoutms(60000);
    BlockingPopReply rep;
    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds{300L});
    auto start = std::chrono::steady_clock::now();
    auto status = stub->blockingPop(&ctx, req, &rep);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{2L});
    if (status.ok()) {
        EXPECT_FALSE(rep.popped());
    } else {
        EXPECT_EQ(status.error_code(), grpc::StatusCode::DEADLINE_EXCEEDED);
    }
}

TEST_F(LockStoreServerTest, KeysAndSize) {
    ASSERT_TRUE(setIfAbsent("lock:a", "1"));
    ASSERT_TRUE(setIfAbsent("lock:b", "1"));
    ASSERT_TRUE(setIfAbsent("other", "1"));
    KeysRequest req;
    req.set_prefix("lock:");
    KeysReply rep;
    grpc::ClientContext ctx1;
    ASSERT_TRUE(stub->keys(&ctx1, req, &rep).ok());
    EXPECT_EQ(rep.keys_size(), 2);

    SizeRequest sreq;
    SizeReply srep;
    grpc::ClientContext ctx2;
    ASSERT_TRUE(stub->size(&ctx2, sreq, &srep).ok());
    EXPECT_EQ(srep.size(), 3U);
}

TEST_F(LockStoreServerTest, ZeroExpireIsRejected) {
    zlock::lockStore::ExpireIfEqualsRequest req;
    req.mutable_key()->set_data("lock:foo");
    req.set_expected("x");
    zlock::lockStore::ExpireIfEqualsReply rep;
    grpc::ClientContext ctx;
    auto status = stub->expireIfEquals(&ctx, req, &rep);
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(zlock::toError(status).code, ErrorCode::InvalidExpire);
}

TEST_F(LockStoreServerTest, ShutdownIsIdempotent) {
    server->shutdown();
    server->shutdown();
    SUCCEED();
}
