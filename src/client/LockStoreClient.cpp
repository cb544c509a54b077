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


#include "client/LockStoreClient.hpp"
#include "client/Config.hpp"
#include <string>
#include "proto/lockStore.pb.h"
#include "proto/lockStore.grpc.pb.h"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <algorithm>

namespace zlock {

namespace {

std::uint64_t toWire(const Ttl& ttl) {
    if (!ttl.has_value()) {
        return 0;
    }
    return static_cast<std::uint64_t>(std::max(ttl->count(), std::chrono::milliseconds::rep{1}));
}

} // namespace

LockStoreClient::LockStoreClient(Config& c) : config(c) {}

std::expected<bool, Error> LockStoreClient::setIfAbsent(const Key& key, const std::string& value, const Ttl& ttl) {
    lockStore::SetIfAbsentRequest request;
    request.mutable_key()->set_data(key.data);
    request.set_value(value);
    request.set_ttlms(toWire(ttl));
    auto t = call("setIfAbsent", request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return t->set();
}

std::expected<std::optional<std::string>, Error> LockStoreClient::get(const Key& key) const {
    lockStore::GetRequest request;
    request.mutable_key()->set_data(key.data);
    auto t = call("get", request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    if (!t->found()) {
        return std::nullopt;
    }
    return t->value();
}

std::expected<bool, Error> LockStoreClient::eraseIfEquals(const Key& key, const std::string& expected) {
    lockStore::EraseIfEqualsRequest request;
    request.mutable_key()->set_data(key.data);
    request.set_expected(expected);
    auto t = call("eraseIfEquals", request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return t->erased();
}

std::expected<bool, Error> LockStoreClient::expireIfEquals(const Key& key, const std::string& expected, std::chrono::milliseconds ttl) {
    lockStore::ExpireIfEqualsRequest request;
    request.mutable_key()->set_data(key.data);
    request.set_expected(expected);
    request.set_ttlms(toWire(ttl));
    auto t = call("expireIfEquals", request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return t->extended();
}

std::expected<std::monostate, Error> LockStoreClient::notify(const Key& channel, const std::string& token, const Ttl& ttl) {
    lockStore::NotifyRequest request;
    request.mutable_key()->set_data(channel.data);
    request.set_token(token);
    request.set_ttlms(toWire(ttl));
    auto t = call("notify", request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return {};
}

std::expected<std::optional<std::string>, Error> LockStoreClient::blockingPop(const Key& channel, std::chrono::milliseconds timeout) {
    lockStore::BlockingPopRequest request;
    request.mutable_key()->set_data(channel.data);
    request.set_timeoutms(static_cast<std::uint64_t>(std::max(timeout, std::chrono::milliseconds::zero()).count()));
    auto t = call("blockingPop", request, timeout);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    if (!t->popped()) {
        return std::nullopt;
    }
    return t->value();
}

std::expected<bool, Error> LockStoreClient::erase(const Key& key) {
    lockStore::EraseRequest request;
    request.mutable_key()->set_data(key.data);
    auto t = call("erase", request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return t->erased();
}

std::expected<std::vector<Key>, Error> LockStoreClient::keys(const std::string& prefix) const {
    lockStore::KeysRequest request;
    request.set_prefix(prefix);
    auto t = call("keys", request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    std::vector<Key> result;
    result.reserve(static_cast<std::size_t>(t->keys_size()));
    for (const auto& k : t->keys()) {
        result.emplace_back(k);
    }
    return result;
}

std::expected<std::size_t, Error> LockStoreClient::size() const {
    lockStore::SizeRequest request;
    auto t = call("size", request);
    if (!t.has_value()) {
        return std::unexpected {t.error()};
    }
    return static_cast<std::size_t>(t->size());
}

} // namespace zlock
