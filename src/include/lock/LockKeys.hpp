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


#ifndef ZLOCK_LOCK_LOCK_KEYS_HPP
#define ZLOCK_LOCK_LOCK_KEYS_HPP

#include "common/Types.hpp"
#include <string>
#include <string_view>

namespace zlock {

// The two store keys behind one lock name. Independent processes using the same
// name always address the same pair.
struct LockKeys {
    static constexpr std::string_view holderPrefix {"lock:"};
    static constexpr std::string_view signalPrefix {"lock-signal:"};

    Key holder;
    Key signal;

    static LockKeys forName(const std::string& name);
    [[nodiscard]] static bool isHolderKey(const Key& key);
    static std::string nameFromHolderKey(const Key& key);
};

} // namespace zlock

#endif // ZLOCK_LOCK_LOCK_KEYS_HPP
