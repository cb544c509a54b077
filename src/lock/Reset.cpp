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


#include "lock/Reset.hpp"
#include "lock/LockKeys.hpp"
#include "lock/SignalChannel.hpp"
#include <spdlog/spdlog.h>
#include <expected>
#include <string>
#include <variant>

namespace zlock {

std::expected<std::monostate, Error> reset(LockStore& store, const std::string& name, const Ttl& signalExpire) {
    auto keys = LockKeys::forName(name);
    auto erased = store.erase(keys.holder);
    if (!erased.has_value()) {
        return std::unexpected {erased.error()};
    }
    spdlog::debug("Reset {} (held: {}).", keys.holder.data, erased.value());
    return SignalChannel {store, keys.signal}.signal(signalExpire);
}

std::expected<std::monostate, Error> resetAll(LockStore& store, const Ttl& signalExpire) {
    auto holders = store.keys(std::string(LockKeys::holderPrefix));
    if (!holders.has_value()) {
        return std::unexpected {holders.error()};
    }
    for (const auto& key : holders.value()) {
        if (!LockKeys::isHolderKey(key)) {
            continue;
        }
        auto r = reset(store, LockKeys::nameFromHolderKey(key), signalExpire);
        if (!r.has_value()) {
            return r;
        }
    }
    return {};
}

} // namespace zlock
