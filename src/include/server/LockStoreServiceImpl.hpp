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


#ifndef ZLOCK_SERVER_LOCK_STORE_SERVICE_IMPL_HPP
#define ZLOCK_SERVER_LOCK_STORE_SERVICE_IMPL_HPP

#include <grpcpp/grpcpp.h>
#include "proto/lockStore.grpc.pb.h"
#include "server/RPCServer.hpp"
#include "storage/LockStore.hpp"

namespace zlock {

class LockStoreServiceImpl final : public lockStore::LockStoreService::Service {
public:
    explicit LockStoreServiceImpl(LockStore& s);
    grpc::Status setIfAbsent(
        grpc::ServerContext* context,
        const lockStore::SetIfAbsentRequest* request,
        lockStore::SetIfAbsentReply* reply) override;
    grpc::Status get(
        grpc::ServerContext* context,
        const lockStore::GetRequest* request,
        lockStore::GetReply* reply) override;
    grpc::Status eraseIfEquals(
        grpc::ServerContext* context,
        const lockStore::EraseIfEqualsRequest* request,
        lockStore::EraseIfEqualsReply* reply) override;
    grpc::Status expireIfEquals(
        grpc::ServerContext* context,
        const lockStore::ExpireIfEqualsRequest* request,
        lockStore::ExpireIfEqualsReply* reply) override;
    grpc::Status notify(
        grpc::ServerContext* context,
        const lockStore::NotifyRequest* request,
        lockStore::NotifyReply* reply) override;
    grpc::Status blockingPop(
        grpc::ServerContext* context,
        const lockStore::BlockingPopRequest* request,
        lockStore::BlockingPopReply* reply) override;
    grpc::Status erase(
        grpc::ServerContext* context,
        const lockStore::EraseRequest* request,
        lockStore::EraseReply* reply) override;
    grpc::Status keys(
        grpc::ServerContext* context,
        const lockStore::KeysRequest* request,
        lockStore::KeysReply* reply) override;
    grpc::Status size(
        grpc::ServerContext* context,
        const lockStore::SizeRequest* request,
        lockStore::SizeReply* reply) override;
private:
    LockStore& store;
};

using LockStoreServer = RPCServer<LockStoreServiceImpl>;

} // namespace zlock

#endif // ZLOCK_SERVER_LOCK_STORE_SERVICE_IMPL_HPP
