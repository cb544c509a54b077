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


#ifndef ZLOCK_COMMON_TYPES_MAP_HPP
#define ZLOCK_COMMON_TYPES_MAP_HPP

#include <type_traits>
#include <proto/lockStore.pb.h>

namespace zlock {
template<class T>
struct map_to;

template<> struct map_to<lockStore::SetIfAbsentRequest> { using type = lockStore::SetIfAbsentReply; };
template<> struct map_to<lockStore::GetRequest> { using type = lockStore::GetReply; };
template<> struct map_to<lockStore::EraseIfEqualsRequest> { using type = lockStore::EraseIfEqualsReply; };
template<> struct map_to<lockStore::ExpireIfEqualsRequest> { using type = lockStore::ExpireIfEqualsReply; };
template<> struct map_to<lockStore::NotifyRequest> { using type = lockStore::NotifyReply; };
template<> struct map_to<lockStore::BlockingPopRequest> { using type = lockStore::BlockingPopReply; };
template<> struct map_to<lockStore::EraseRequest> { using type = lockStore::EraseReply; };
template<> struct map_to<lockStore::KeysRequest> { using type = lockStore::KeysReply; };
template<> struct map_to<lockStore::SizeRequest> { using type = lockStore::SizeReply; };

template<class T>
using map_to_t = typename map_to<T>::type;

template<class T>
concept has_mapping = requires { typename map_to<T>::type; };

} // namespace zlock
#endif // ZLOCK_COMMON_TYPES_MAP_HPP
