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


#ifndef ZLOCK_STORAGE_IN_MEMORY_LOCK_STORE_HPP
#define ZLOCK_STORAGE_IN_MEMORY_LOCK_STORE_HPP

#include <string>
#include <deque>
#include <unordered_map>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <expected>
#include <optional>
#include <vector>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/LockStore.hpp"

namespace zlock {

class InMemoryLockStore : public LockStore {
public:
    InMemoryLockStore();
    InMemoryLockStore(const InMemoryLockStore&) = delete;
    InMemoryLockStore& operator=(const InMemoryLockStore&) = delete;
    std::expected<bool, Error> setIfAbsent(const Key& key, const std::string& value, const Ttl& ttl) override;
    std::expected<std::optional<std::string>, Error> get(const Key& key) const override;
    std::expected<bool, Error> eraseIfEquals(const Key& key, const std::string& expected) override;
    std::expected<bool, Error> expireIfEquals(const Key& key, const std::string& expected, std::chrono::milliseconds ttl) override;
    std::expected<std::monostate, Error> notify(const Key& channel, const std::string& token, const Ttl& ttl) override;
    std::expected<std::optional<std::string>, Error> blockingPop(const Key& channel, std::chrono::milliseconds timeout) override;
    std::expected<bool, Error> erase(const Key& key) override;
    std::expected<std::vector<Key>, Error> keys(const std::string& prefix) const override;
    std::expected<std::size_t, Error> size() const override;
    // Remaining lifetime of key; std::nullopt when absent or persistent.
    std::optional<std::chrono::milliseconds> ttl(const Key& key) const;
    // Length of the list at channel; zero when absent.
    std::size_t length(const Key& channel) const;
private:
    using Clock = std::chrono::steady_clock;
    struct Entry {
        bool isList;
        std::string data;
        std::deque<std::string> list;
        std::optional<Clock::time_point> expiresAt;
        [[nodiscard]] bool expired(Clock::time_point now) const {
            return expiresAt.has_value() && expiresAt.value() <= now;
        }
    };
    using map = std::unordered_map<Key, Entry, KeyHash>;
    // Finds a live entry. The mutable overload also drops an expired one.
    map::iterator live(const Key& key, Clock::time_point now);
    map::const_iterator live(const Key& key, Clock::time_point now) const;
    mutable std::mutex m;
    std::condition_variable cv;
    map store;
};

} // namespace zlock

#endif // ZLOCK_STORAGE_IN_MEMORY_LOCK_STORE_HPP
