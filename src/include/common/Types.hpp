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


#ifndef ZLOCK_COMMON_TYPES_HPP
#define ZLOCK_COMMON_TYPES_HPP

#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include "proto/lockStore.pb.h"

namespace zlock {

struct Key {
    std::string data;

    Key(const std::string& d) : data(d) {}

    Key(const lockStore::Key& protoKey) : data(protoKey.data()) {}

    bool operator==(const Key& other) const {
        return data == other.data;
    }
};

struct KeyHash {
    std::size_t operator()(const Key& key) const {
        return std::hash<std::string>()(key.data);
    }
};

// Optional key lifetime; std::nullopt means the key never expires.
using Ttl = std::optional<std::chrono::milliseconds>;

} // namespace zlock

#endif // ZLOCK_COMMON_TYPES_HPP
