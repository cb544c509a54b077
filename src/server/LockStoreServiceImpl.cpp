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


#include "server/LockStoreServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <grpcpp/support/status.h>
#include "proto/lockStore.pb.h"
#include <algorithm>
#include <chrono>
#include <optional>
#include <tuple>
#include <cstdint>

namespace zlock {

namespace {

Ttl fromWire(std::uint64_t ms) {
    if (ms == 0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(ms));
}

} // namespace

LockStoreServiceImpl::LockStoreServiceImpl(LockStore& s)
    : store {s} {}

grpc::Status LockStoreServiceImpl::setIfAbsent(
    grpc::ServerContext* context,
    const lockStore::SetIfAbsentRequest* request,
    lockStore::SetIfAbsentReply* reply) {
    std::ignore = context;
    auto r = store.setIfAbsent(Key{request->key()}, request->value(), fromWire(request->ttlms()));
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_set(r.value());
    return grpc::Status::OK;
}

grpc::Status LockStoreServiceImpl::get(
    grpc::ServerContext* context,
    const lockStore::GetRequest* request,
    lockStore::GetReply* reply) {
    std::ignore = context;
    auto r = store.get(Key{request->key()});
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_found(r->has_value());
    if (r->has_value()) {
        reply->set_value(r->value());
    }
    return grpc::Status::OK;
}

grpc::Status LockStoreServiceImpl::eraseIfEquals(
    grpc::ServerContext* context,
    const lockStore::EraseIfEqualsRequest* request,
    lockStore::EraseIfEqualsReply* reply) {
    std::ignore = context;
    auto r = store.eraseIfEquals(Key{request->key()}, request->expected());
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_erased(r.value());
    return grpc::Status::OK;
}

grpc::Status LockStoreServiceImpl::expireIfEquals(
    grpc::ServerContext* context,
    const lockStore::ExpireIfEqualsRequest* request,
    lockStore::ExpireIfEqualsReply* reply) {
    std::ignore = context;
    if (request->ttlms() == 0) {
        return toGrpcStatus(Error {ErrorCode::InvalidExpire, "expire must be > zero", request->key().data()});
    }
    auto r = store.expireIfEquals(Key{request->key()}, request->expected(), std::chrono::milliseconds(static_cast<std::int64_t>(request->ttlms())));
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_extended(r.value());
    return grpc::Status::OK;
}

grpc::Status LockStoreServiceImpl::notify(
    grpc::ServerContext* context,
    const lockStore::NotifyRequest* request,
    lockStore::NotifyReply* reply) {
    std::ignore = context;
    std::ignore = reply;
    return toGrpcStatus(store.notify(Key{request->key()}, request->token(), fromWire(request->ttlms())));
}

grpc::Status LockStoreServiceImpl::blockingPop(
    grpc::ServerContext* context,
    const lockStore::BlockingPopRequest* request,
    lockStore::BlockingPopReply* reply) {
    auto timeout = std::chrono::milliseconds(static_cast<std::int64_t>(request->timeoutms()));
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(context->deadline() - std::chrono::system_clock::now());
    timeout = std::clamp(left, std::chrono::milliseconds::zero(), timeout);
    auto r = store.blockingPop(Key{request->key()}, timeout);
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_popped(r->has_value());
    if (r->has_value()) {
        reply->set_value(r->value());
    }
    return grpc::Status::OK;
}

grpc::Status LockStoreServiceImpl::erase(
    grpc::ServerContext* context,
    const lockStore::EraseRequest* request,
    lockStore::EraseReply* reply) {
    std::ignore = context;
    auto r = store.erase(Key{request->key()});
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_erased(r.value());
    return grpc::Status::OK;
}

grpc::Status LockStoreServiceImpl::keys(
    grpc::ServerContext* context,
    const lockStore::KeysRequest* request,
    lockStore::KeysReply* reply) {
    std::ignore = context;
    auto r = store.keys(request->prefix());
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    for (const auto& k : r.value()) {
        reply->add_keys()->set_data(k.data);
    }
    return grpc::Status::OK;
}

grpc::Status LockStoreServiceImpl::size(
    grpc::ServerContext* context,
    const lockStore::SizeRequest* request,
    lockStore::SizeReply* reply) {
    std::ignore = context;
    std::ignore = request;
    auto r = store.size();
    if (!r.has_value()) {
        return toGrpcStatus(r.error());
    }
    reply->set_size(r.value());
    return grpc::Status::OK;
}

} // namespace zlock
