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


#include "client/Config.hpp"
#include <string>
#include "common/RetryPolicy.hpp"
#include <utility>
#include <stdexcept>
#include "common/Error.hpp"
#include <expected>
#include <unordered_map>

namespace zlock {

namespace {

using Stub = lockStore::LockStoreService::Stub;

template<typename Req, typename Rep>
LockStoreRPCService::function_t bindStub(
    const std::string& op,
    grpc::Status (Stub::*method)(grpc::ClientContext*, const Req&, Rep*)) {
    return [op, method](std::shared_ptr<Stub> stub,
                        grpc::ClientContext* ctx,
                        const google::protobuf::Message& req,
                        google::protobuf::Message* resp) -> grpc::Status {
        if (!stub || !resp ||
            req.GetDescriptor() != Req::descriptor() ||
            resp->GetDescriptor() != Rep::descriptor()) {
            return {grpc::StatusCode::INVALID_ARGUMENT,
                    op + ": type mismatch or null resp"};
        }
        return ((*stub).*method)(ctx, static_cast<const Req&>(req), static_cast<Rep*>(resp));
    };
}

} // namespace

std::unordered_map<std::string, LockStoreRPCService::function_t>& getDefaultLockStoreFunctions() {
    static std::unordered_map<std::string, LockStoreRPCService::function_t> map {
        { "setIfAbsent", bindStub("setIfAbsent", &Stub::setIfAbsent) },
        { "get", bindStub("get", &Stub::get) },
        { "eraseIfEquals", bindStub("eraseIfEquals", &Stub::eraseIfEquals) },
        { "expireIfEquals", bindStub("expireIfEquals", &Stub::expireIfEquals) },
        { "notify", bindStub("notify", &Stub::notify) },
        { "blockingPop", bindStub("blockingPop", &Stub::blockingPop) },
        { "erase", bindStub("erase", &Stub::erase) },
        { "keys", bindStub("keys", &Stub::keys) },
        { "size", bindStub("size", &Stub::size) }
    };
    return map;
}

Config::Config(const std::string& address, const RetryPolicy p, std::unordered_map<std::string, LockStoreRPCService::function_t> f)
    : policy{p},
      store{address, p, std::move(f), stopCalls} {
    if (address.empty()) {
        throw std::invalid_argument("Config: No address provided");
    }
}

Config::~Config() {
    stop();
}

void Config::stop() {
    stopCalls = true;
}

std::expected<LockStoreRPCServicePtr, Error> Config::service() {
    if (!store.available()) {
        return std::unexpected {Error(ErrorCode::ServiceTemporarilyUnavailable, "Store @" + store.address() + " is unavailable")};
    }
    return &store;
}

} // namespace zlock
