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


#include "lock/Lock.hpp"
#include "lock/Reset.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace zlock {

namespace {

LockOptions checked(LockOptions options) {
    auto normalized = normalize(std::move(options));
    auto valid = validate(normalized);
    if (!valid.has_value()) {
        throw std::invalid_argument("Lock: " + toString(valid.error().code) + ": " + valid.error().what);
    }
    return normalized;
}

const std::string& checkedName(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Lock: " + toString(ErrorCode::InvalidLockName) + ": name must not be empty");
    }
    return name;
}

} // namespace

Lock::Lock(LockStore& s, std::string name, LockOptions o)
    : store{s},
      lockName{checkedName(name)},
      options{checked(std::move(o))},
      ownerIdentity{options.ownerId.value_or(generate_owner_id())},
      keys{LockKeys::forName(lockName)},
      channel{s, keys.signal},
      isHeld{false} {}

Lock::~Lock() {
    renewal.stop();
}

std::expected<bool, Error> Lock::acquire(bool blocking, std::optional<Duration> timeout) {
    if (isHeld) {
        return std::unexpected {Error {ErrorCode::AlreadyAcquired, "Already acquired from this Lock", keys.holder.data}};
    }
    auto valid = validateAcquire(options, blocking, timeout);
    if (!valid.has_value()) {
        return std::unexpected {valid.error()};
    }
    if (timeout.has_value() && timeout.value() == Duration::zero()) {
        timeout.reset();
    }
    if (blocking && !timeout.has_value()) {
        timeout = options.timeout;
    }
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout.has_value()) {
        deadline = std::chrono::steady_clock::now() + timeout.value();
    }

    options.logger->debug("Getting {} ...", keys.holder.data);
    auto last = false;
    while (true) {
        auto set = store.setIfAbsent(keys.holder, ownerIdentity, options.expire);
        if (!set.has_value()) {
            return std::unexpected {set.error()};
        }
        if (set.value()) {
            break;
        }
        auto holder = store.get(keys.holder);
        if (!holder.has_value()) {
            return std::unexpected {holder.error()};
        }
        if (holder.value() == ownerIdentity) {
            return std::unexpected {Error {ErrorCode::AlreadyAcquired, "Already acquired from this owner id: " + ownerIdentity, keys.holder.data}};
        }
        // Freed between the set and the get.
        if (blocking && !last && !holder->has_value()) {
            continue;
        }
        if (!blocking || last) {
            options.logger->debug("Failed to get {}.", keys.holder.data);
            return false;
        }
        auto woke = channel.wait(waitFor(deadline));
        if (!woke.has_value()) {
            return std::unexpected {woke.error()};
        }
        if (deadline.has_value() && std::chrono::steady_clock::now() >= deadline.value()) {
            last = true;
        }
    }
    options.logger->debug("Got lock for {}.", keys.holder.data);
    isHeld = true;
    if (options.autoRenewal) {
        startRenewal();
    }
    return true;
}

Lock::Duration Lock::waitFor(const std::optional<std::chrono::steady_clock::time_point>& deadline) const {
    auto bound = std::min(options.expire.value_or(options.idleWakeup), options.idleWakeup);
    if (!deadline.has_value()) {
        return bound;
    }
    auto remaining = std::chrono::ceil<Duration>(deadline.value() - std::chrono::steady_clock::now());
    return std::clamp(remaining, Duration::zero(), bound);
}

std::expected<std::monostate, Error> Lock::release() {
    renewal.stop();
    options.logger->debug("Releasing {}.", keys.holder.data);
    auto erased = store.eraseIfEquals(keys.holder, ownerIdentity);
    if (!erased.has_value()) {
        return std::unexpected {erased.error()};
    }
    isHeld = false;
    if (!erased.value()) {
        return std::unexpected {Error {ErrorCode::NotAcquired, "Lock " + lockName + " is not acquired or it already expired", keys.holder.data}};
    }
    return channel.signal(options.signalExpire);
}

std::expected<std::monostate, Error> Lock::extend(std::optional<Duration> expire) {
    if (expire.has_value() && expire.value() < Duration::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidExpire, "Expire must be >= zero", keys.holder.data}};
    }
    if (expire.has_value() && expire.value() == Duration::zero()) {
        expire.reset();
    }
    auto ttl = expire.has_value() ? expire : options.expire;
    if (!ttl.has_value()) {
        return std::unexpected {Error {ErrorCode::NotExpirable, "Lock " + lockName + " has no assigned expiration time", keys.holder.data}};
    }
    auto extended = store.expireIfEquals(keys.holder, ownerIdentity, ttl.value());
    if (!extended.has_value()) {
        return std::unexpected {extended.error()};
    }
    if (!extended.value()) {
        return std::unexpected {Error {ErrorCode::NotAcquired, "Lock " + lockName + " is not acquired or it already expired", keys.holder.data}};
    }
    return {};
}

std::expected<std::monostate, Error> Lock::reset() {
    return zlock::reset(store, lockName, options.signalExpire);
}

std::expected<bool, Error> Lock::locked() const {
    auto holder = store.get(keys.holder);
    if (!holder.has_value()) {
        return std::unexpected {holder.error()};
    }
    return holder->has_value();
}

std::expected<std::optional<std::string>, Error> Lock::ownerId() const {
    return store.get(keys.holder);
}

const std::string& Lock::id() const {
    return ownerIdentity;
}

const std::string& Lock::name() const {
    return lockName;
}

bool Lock::held() const {
    return isHeld;
}

bool Lock::renewing() const {
    return renewal.running();
}

void Lock::startRenewal() {
    auto interval = options.expire.value() * 2 / 3;
    options.logger->debug("Starting renewal of {} every {}ms.", keys.holder.data, interval.count());
    renewal.start(std::max(interval, Duration{1}), [this] { return renew(); });
}

// Runs on the renewal thread.
bool Lock::renew() {
    auto extended = store.expireIfEquals(keys.holder, ownerIdentity, options.expire.value());
    if (extended.has_value() && extended.value()) {
        return true;
    }
    auto error = extended.has_value()
        ? Error {ErrorCode::NotAcquired, "Lock " + lockName + " was lost before it could be renewed", keys.holder.data}
        : extended.error();
    options.logger->error("Renewal of {} stopped: {}: {}", keys.holder.data, toString(error.code), error.what);
    if (options.onLost) {
        options.onLost(lockName, error);
    }
    return false;
}

} // namespace zlock
