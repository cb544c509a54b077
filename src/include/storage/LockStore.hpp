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


#ifndef ZLOCK_STORAGE_LOCK_STORE_HPP
#define ZLOCK_STORAGE_LOCK_STORE_HPP

#include "common/Types.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <cstddef>

namespace zlock {

// The store primitives the lock protocol is built on. Every operation is atomic
// with respect to every other one, and an expired key is indistinguishable from
// an absent one.
class LockStore {
public:
    virtual ~LockStore() = default;

    // SET key value NX [PX ttl]. True iff the key was absent and is now set.
    virtual std::expected<bool, Error> setIfAbsent(const Key& key, const std::string& value, const Ttl& ttl) = 0;

    virtual std::expected<std::optional<std::string>, Error> get(const Key& key) const = 0;

    // Deletes key only if it currently holds expected.
    virtual std::expected<bool, Error> eraseIfEquals(const Key& key, const std::string& expected) = 0;

    // Resets key's lifetime to ttl only if it currently holds expected.
    virtual std::expected<bool, Error> expireIfEquals(const Key& key, const std::string& expected, std::chrono::milliseconds ttl) = 0;

    // Replaces the list at channel with the single element token and gives it
    // the lifetime ttl, waking one blocked popper.
    virtual std::expected<std::monostate, Error> notify(const Key& channel, const std::string& token, const Ttl& ttl) = 0;

    // Pops the head of the list at channel, waiting up to timeout for one to
    // arrive. std::nullopt on timeout.
    virtual std::expected<std::optional<std::string>, Error> blockingPop(const Key& channel, std::chrono::milliseconds timeout) = 0;

    virtual std::expected<bool, Error> erase(const Key& key) = 0;

    virtual std::expected<std::vector<Key>, Error> keys(const std::string& prefix) const = 0;

    virtual std::expected<std::size_t, Error> size() const = 0;
};

} // namespace zlock

#endif // ZLOCK_STORAGE_LOCK_STORE_HPP
