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


#include "lock/LockKeys.hpp"
#include <string>
#include <stdexcept>

namespace zlock {

LockKeys LockKeys::forName(const std::string& name) {
    return LockKeys {
        Key {std::string(holderPrefix) + name},
        Key {std::string(signalPrefix) + name}
    };
}

bool LockKeys::isHolderKey(const Key& key) {
    return key.data.size() > holderPrefix.size() && key.data.starts_with(holderPrefix);
}

std::string LockKeys::nameFromHolderKey(const Key& key) {
    if (!isHolderKey(key)) {
        throw std::invalid_argument("LockKeys: not a holder key: " + key.data);
    }
    return key.data.substr(holderPrefix.size());
}

} // namespace zlock
