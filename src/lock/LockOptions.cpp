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


#include "lock/LockOptions.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <utility>

namespace zlock {

namespace {

void dropZero(std::optional<LockOptions::Duration>& d) {
    if (d.has_value() && d.value() == LockOptions::Duration::zero()) {
        d.reset();
    }
}

bool negative(const std::optional<LockOptions::Duration>& d) {
    return d.has_value() && d.value() < LockOptions::Duration::zero();
}

} // namespace

LockOptions normalize(LockOptions options) {
    dropZero(options.expire);
    dropZero(options.timeout);
    if (!options.logger) {
        options.logger = spdlog::default_logger();
    }
    return options;
}

std::expected<std::monostate, Error> validate(const LockOptions& options) {
    if (options.ownerId.has_value() && options.ownerId->empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Owner id must not be empty"}};
    }
    if (negative(options.expire)) {
        return std::unexpected {Error {ErrorCode::InvalidExpire, "Expire must be >= zero"}};
    }
    if (negative(options.timeout)) {
        return std::unexpected {Error {ErrorCode::InvalidTimeout, "Timeout must be >= zero"}};
    }
    if (options.signalExpire <= LockOptions::Duration::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidExpire, "Signal expire must be > zero"}};
    }
    if (options.idleWakeup <= LockOptions::Duration::zero()) {
        return std::unexpected {Error {ErrorCode::InvalidTimeout, "Idle wakeup must be > zero"}};
    }
    if (options.autoRenewal && !options.expire.has_value()) {
        return std::unexpected {Error {ErrorCode::RenewalWithoutExpire, "Auto renewal requires an expire"}};
    }
    return validateAcquire(options, true, std::nullopt);
}

std::expected<std::monostate, Error> validateAcquire(
    const LockOptions& options,
    bool blocking,
    const std::optional<LockOptions::Duration>& timeout) {
    if (!blocking && timeout.has_value()) {
        return std::unexpected {Error {ErrorCode::TimeoutNotUsable, "Timeout cannot be used with blocking=false"}};
    }
    if (negative(timeout)) {
        return std::unexpected {Error {ErrorCode::InvalidTimeout, "Timeout must be >= zero"}};
    }
    auto effective = timeout.has_value() && timeout.value() > LockOptions::Duration::zero() ? timeout : options.timeout;
    if (blocking && effective.has_value() && options.expire.has_value() &&
        effective.value() > options.expire.value() && !options.autoRenewal) {
        return std::unexpected {Error {
            ErrorCode::TimeoutTooLarge,
            "Timeout (" + std::to_string(effective->count()) + "ms) cannot be greater than expire (" +
                std::to_string(options.expire->count()) + "ms)"}};
    }
    return {};
}

} // namespace zlock
