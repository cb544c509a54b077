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


#include "lock/SignalChannel.hpp"
#include <chrono>
#include <expected>
#include <utility>
#include <algorithm>

namespace zlock {

SignalChannel::SignalChannel(LockStore& s, Key k) : store{s}, channel{std::move(k)} {}

std::expected<bool, Error> SignalChannel::wait(std::chrono::milliseconds timeout) {
    auto popped = store.blockingPop(channel, std::max(timeout, std::chrono::milliseconds::zero()));
    if (!popped.has_value()) {
        return std::unexpected {popped.error()};
    }
    return popped->has_value();
}

std::expected<std::monostate, Error> SignalChannel::signal(const Ttl& ttl) {
    return store.notify(channel, token, ttl);
}

const Key& SignalChannel::key() const {
    return channel;
}

} // namespace zlock
