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


#ifndef ZLOCK_CLIENT_CONFIG_HPP
#define ZLOCK_CLIENT_CONFIG_HPP

#include <unordered_map>
#include <expected>
#include "common/Error.hpp"
#include "common/RPCService.hpp"
#include "common/RetryPolicy.hpp"
#include <proto/lockStore.grpc.pb.h>
#include <proto/lockStore.pb.h>
#include <atomic>
#include <string>
#include <functional>

namespace zlock {

using LockStoreRPCService = RPCService<lockStore::LockStoreService>;
using LockStoreRPCServicePtr = LockStoreRPCService*;

std::unordered_map<std::string, LockStoreRPCService::function_t>& getDefaultLockStoreFunctions();

// The one store service a client talks to, and how hard it tries it. Stores do
// not replicate, so a client never moves to another address.
class Config {
public:
    Config(const std::string& address, const RetryPolicy policy, std::unordered_map<std::string, LockStoreRPCService::function_t> f = getDefaultLockStoreFunctions());
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    ~Config();
    // The store service, connecting first if needed.
    std::expected<LockStoreRPCServicePtr, Error> service();
    // Makes in-flight retries give up; used on shutdown.
    void stop();
    const RetryPolicy policy;
private:
    std::atomic<bool> stopCalls {false};
    LockStoreRPCService store;
};

} // namespace zlock

#endif // ZLOCK_CLIENT_CONFIG_HPP
