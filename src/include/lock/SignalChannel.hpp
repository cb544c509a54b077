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


#ifndef ZLOCK_LOCK_SIGNAL_CHANNEL_HPP
#define ZLOCK_LOCK_SIGNAL_CHANNEL_HPP

#include "storage/LockStore.hpp"
#include "common/Types.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <variant>

namespace zlock {

// Wakes blocked acquirers of one lock the moment it is released. Ordering among
// waiters is whatever the store's blocking pop provides.
class SignalChannel {
public:
    SignalChannel(LockStore& s, Key k);
    // True iff a wake token was consumed before timeout elapsed.
    std::expected<bool, Error> wait(std::chrono::milliseconds timeout);
    std::expected<std::monostate, Error> signal(const Ttl& ttl);
    [[nodiscard]] const Key& key() const;
    static constexpr auto token = "1";
private:
    LockStore& store;
    Key channel;
};

} // namespace zlock

#endif // ZLOCK_LOCK_SIGNAL_CHANNEL_HPP
