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


#ifndef ZLOCK_LOCK_RESET_HPP
#define ZLOCK_LOCK_RESET_HPP

#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/LockStore.hpp"
#include <expected>
#include <string>
#include <variant>

namespace zlock {

// Deletes the holder of name, whoever it is, and leaves one wake token with
// lifetime signalExpire on its channel. Meant for crash recovery.
std::expected<std::monostate, Error> reset(LockStore& store, const std::string& name, const Ttl& signalExpire);

// reset() for every lock currently held in store. Safe to run alongside live
// acquire and release traffic.
std::expected<std::monostate, Error> resetAll(LockStore& store, const Ttl& signalExpire);

} // namespace zlock

#endif // ZLOCK_LOCK_RESET_HPP
