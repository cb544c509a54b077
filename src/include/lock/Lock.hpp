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


#ifndef ZLOCK_LOCK_LOCK_HPP
#define ZLOCK_LOCK_LOCK_HPP

#include "common/Error.hpp"
#include "lock/LockKeys.hpp"
#include "lock/LockOptions.hpp"
#include "lock/RenewalScheduler.hpp"
#include "lock/SignalChannel.hpp"
#include "storage/LockStore.hpp"
#include <atomic>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <variant>

namespace zlock {

// A named mutual-exclusion lock whose only shared state lives in a LockStore.
// One handle is used from one thread; distinct handles, in this or other
// processes, coordinate through the store alone.
class Lock {
public:
    using Duration = LockOptions::Duration;

    // Throws std::invalid_argument on an empty name or invalid options.
    Lock(LockStore& s, std::string name, LockOptions options = {});
    // Stops renewal. The holder key is left to expire on its own.
    ~Lock();
    Lock(const Lock&) = delete;
    Lock& operator=(const Lock&) = delete;

    // true once the lock is held. false when a non-blocking attempt finds it
    // busy, or when the timeout elapses. A timeout given here overrides the
    // one in the options.
    std::expected<bool, Error> acquire(bool blocking = true, std::optional<Duration> timeout = std::nullopt);
    // Fails with NotAcquired unless the store records this id as the holder.
    // The compare-and-delete and the wake signal are separate store calls: an
    // error from the signal means the lock is already free and no longer held,
    // but waiters may sleep until their idle wakeup.
    std::expected<std::monostate, Error> release();
    // Resets the holder key's lifetime to expire, or to the configured one.
    std::expected<std::monostate, Error> extend(std::optional<Duration> expire = std::nullopt);
    // Force-releases the lock whoever holds it and wakes its waiters.
    std::expected<std::monostate, Error> reset();

    [[nodiscard]] std::expected<bool, Error> locked() const;
    [[nodiscard]] std::expected<std::optional<std::string>, Error> ownerId() const;
    [[nodiscard]] const std::string& id() const;
    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] bool held() const;
    [[nodiscard]] bool renewing() const;
private:
    Duration waitFor(const std::optional<std::chrono::steady_clock::time_point>& deadline) const;
    void startRenewal();
    bool renew();
    LockStore& store;
    const std::string lockName;
    const LockOptions options;
    const std::string ownerIdentity;
    const LockKeys keys;
    SignalChannel channel;
    std::atomic<bool> isHeld;
    RenewalScheduler renewal;
};

} // namespace zlock

#endif // ZLOCK_LOCK_LOCK_HPP
