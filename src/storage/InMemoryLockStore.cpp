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


#include "storage/InMemoryLockStore.hpp"
#include <expected>
#include <string>
#include <mutex>
#include <chrono>
#include <cstddef>
#include <optional>
#include <variant>
#include <vector>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace zlock {

InMemoryLockStore::InMemoryLockStore() : m{}, cv{}, store{} {}

InMemoryLockStore::map::iterator InMemoryLockStore::live(const Key& key, Clock::time_point now) {
    auto i = store.find(key);
    if (i != store.end() && i->second.expired(now)) {
        store.erase(i);
        return store.end();
    }
    return i;
}

InMemoryLockStore::map::const_iterator InMemoryLockStore::live(const Key& key, Clock::time_point now) const {
    auto i = store.find(key);
    if (i != store.end() && i->second.expired(now)) {
        return store.end();
    }
    return i;
}

std::expected<bool, Error> InMemoryLockStore::setIfAbsent(const Key& key, const std::string& value, const Ttl& ttl) {
    const std::lock_guard lock {m};
    auto now = Clock::now();
    if (live(key, now) != store.end()) {
        return false;
    }
    Entry e {false, value, {}, std::nullopt};
    if (ttl.has_value()) {
        e.expiresAt = now + ttl.value();
    }
    store.insert_or_assign(key, std::move(e));
    return true;
}

std::expected<std::optional<std::string>, Error> InMemoryLockStore::get(const Key& key) const {
    const std::lock_guard lock {m};
    auto i = live(key, Clock::now());
    if (i == store.end()) {
        return std::nullopt;
    }
    if (i->second.isList) {
        return std::unexpected {Error {ErrorCode::WrongType, "Operation against a key holding a list", key.data}};
    }
    return i->second.data;
}

std::expected<bool, Error> InMemoryLockStore::eraseIfEquals(const Key& key, const std::string& expected) {
    const std::lock_guard lock {m};
    auto i = live(key, Clock::now());
    if (i == store.end() || i->second.isList || i->second.data != expected) {
        return false;
    }
    store.erase(i);
    return true;
}

std::expected<bool, Error> InMemoryLockStore::expireIfEquals(const Key& key, const std::string& expected, std::chrono::milliseconds ttl) {
    const std::lock_guard lock {m};
    auto now = Clock::now();
    auto i = live(key, now);
    if (i == store.end() || i->second.isList || i->second.data != expected) {
        return false;
    }
    i->second.expiresAt = now + ttl;
    return true;
}

std::expected<std::monostate, Error> InMemoryLockStore::notify(const Key& channel, const std::string& token, const Ttl& ttl) {
    {
        const std::lock_guard lock {m};
        Entry e {true, {}, {token}, std::nullopt};
        if (ttl.has_value()) {
            e.expiresAt = Clock::now() + ttl.value();
        }
        store.insert_or_assign(channel, std::move(e));
    }
    cv.notify_all();
    return {};
}

std::expected<std::optional<std::string>, Error> InMemoryLockStore::blockingPop(const Key& channel, std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    std::unique_lock lock {m};
    while (true) {
        auto i = live(channel, Clock::now());
        if (i != store.end()) {
            if (!i->second.isList) {
                return std::unexpected {Error {ErrorCode::WrongType, "Operation against a key holding a string", channel.data}};
            }
            auto token = std::move(i->second.list.front());
            i->second.list.pop_front();
            if (i->second.list.empty()) {
                store.erase(i);
            }
            return token;
        }
        if (cv.wait_until(lock, deadline) == std::cv_status::timeout &&
            live(channel, Clock::now()) == store.end()) {
            return std::nullopt;
        }
    }
}

std::expected<bool, Error> InMemoryLockStore::erase(const Key& key) {
    const std::lock_guard lock {m};
    auto i = live(key, Clock::now());
    if (i == store.end()) {
        return false;
    }
    store.erase(i);
    return true;
}

std::expected<std::vector<Key>, Error> InMemoryLockStore::keys(const std::string& prefix) const {
    const std::lock_guard lock {m};
    auto now = Clock::now();
    std::vector<Key> result;
    for (const auto& [k, e] : store) {
        if (!e.expired(now) && k.data.starts_with(prefix)) {
            result.push_back(k);
        }
    }
    return result;
}

std::expected<std::size_t, Error> InMemoryLockStore::size() const {
    const std::lock_guard lock {m};
    auto now = Clock::now();
    std::size_t n = 0;
    for (const auto& [k, e] : store) {
        if (!e.expired(now)) {
            ++n;
        }
    }
    return n;
}

std::optional<std::chrono::milliseconds> InMemoryLockStore::ttl(const Key& key) const {
    const std::lock_guard lock {m};
    auto now = Clock::now();
    auto i = live(key, now);
    if (i == store.end() || !i->second.expiresAt.has_value()) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(i->second.expiresAt.value() - now);
}

std::size_t InMemoryLockStore::length(const Key& channel) const {
    const std::lock_guard lock {m};
    auto i = live(channel, Clock::now());
    if (i == store.end() || !i->second.isList) {
        return 0;
    }
    return i->second.list.size();
}

} // namespace zlock
