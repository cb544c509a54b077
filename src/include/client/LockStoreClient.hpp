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


#ifndef ZLOCK_CLIENT_LOCK_STORE_CLIENT_HPP
#define ZLOCK_CLIENT_LOCK_STORE_CLIENT_HPP

#include <algorithm>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include <variant>
#include <spdlog/spdlog.h>
#include "client/Config.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Types.hpp"
#include "common/TypesMap.hpp"
#include "storage/LockStore.hpp"

namespace zlock {

// A LockStore living in another process, reached through gRPC. Safe to share
// between a lock's caller and its renewal thread.
class LockStoreClient : public LockStore {
public:
    explicit LockStoreClient(Config& c);
    LockStoreClient(const LockStoreClient&) = delete;
    LockStoreClient& operator=(const LockStoreClient&) = delete;
    std::expected<bool, Error> setIfAbsent(const Key& key, const std::string& value, const Ttl& ttl) override;
    std::expected<std::optional<std::string>, Error> get(const Key& key) const override;
    std::expected<bool, Error> eraseIfEquals(const Key& key, const std::string& expected) override;
    std::expected<bool, Error> expireIfEquals(const Key& key, const std::string& expected, std::chrono::milliseconds ttl) override;
    std::expected<std::monostate, Error> notify(const Key& channel, const std::string& token, const Ttl& ttl) override;
    std::expected<std::optional<std::string>, Error> blockingPop(const Key& channel, std::chrono::milliseconds timeout) override;
    std::expected<bool, Error> erase(const Key& key) override;
    std::expected<std::vector<Key>, Error> keys(const std::string& prefix) const override;
    std::expected<std::size_t, Error> size() const override;
private:
    template<typename Req, typename Rep=map_to_t<Req>>
    std::expected<Rep, Error> call(
        const std::string& op,
        const Req& request,
        std::chrono::milliseconds extra = std::chrono::milliseconds::zero()) const {
        auto last = Error(ErrorCode::ServiceTemporarilyUnavailable, "Store is unavailable");
        for (int i = 0; i < std::max(config.policy.connectAttempts, 1); ++i) {
            auto serviceResult = config.service();
            if (!serviceResult.has_value()) {
                last = serviceResult.error();
                continue;
            }
            spdlog::trace("Calling {} on {}", op, serviceResult.value()->address());
            auto callResult = serviceResult.value()->template call<Req, Rep>(op, request, extra);
            if (callResult.has_value()) {
                return callResult.value();
            }
            last = callResult.error().back();
            if (!isRetriable(op, last.code)) {
                break;
            }
        }
        return std::unexpected {last};
    }
    Config& config;
};

} // namespace zlock

#endif // ZLOCK_CLIENT_LOCK_STORE_CLIENT_HPP
