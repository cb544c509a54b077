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


#ifndef ZLOCK_LOCK_LOCK_OPTIONS_HPP
#define ZLOCK_LOCK_LOCK_OPTIONS_HPP

#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <spdlog/logger.h>

namespace zlock {

struct LockOptions {
    using Duration = std::chrono::milliseconds;
    // Called from the renewal thread when the lease is found lost.
    using LostCallback = std::function<void(const std::string& name, const Error& error)>;

    // Shared by every process that must be recognised as the same owner. A
    // random id is generated when absent.
    std::optional<std::string> ownerId;
    // Lifetime of the holder key. Absent or zero never expires.
    std::optional<Duration> expire;
    // Default acquisition timeout. Absent or zero waits forever.
    std::optional<Duration> timeout;
    bool autoRenewal {false};
    // Lifetime of the wake token left behind by a release or reset.
    Duration signalExpire {1000};
    // Upper bound on one blocking wait when nothing else bounds it.
    Duration idleWakeup {1000};
    std::shared_ptr<spdlog::logger> logger;
    LostCallback onLost;
};

// Zero durations become absent; a missing logger becomes spdlog's default.
LockOptions normalize(LockOptions options);

// Checks an already normalized set of options.
std::expected<std::monostate, Error> validate(const LockOptions& options);

// Checks the arguments of one acquire() call against the options.
std::expected<std::monostate, Error> validateAcquire(
    const LockOptions& options,
    bool blocking,
    const std::optional<LockOptions::Duration>& timeout);

} // namespace zlock

#endif // ZLOCK_LOCK_LOCK_OPTIONS_HPP
