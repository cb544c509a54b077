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


#ifndef ZLOCK_COMMON_ERROR_HPP
#define ZLOCK_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <type_traits>
#include <proto/error.pb.h>

namespace zlock {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    ServiceTemporarilyUnavailable = 2,
    KeyNotFound = 4,
    WrongType = 5,
    Timeout = 6,
    Internal = 7,
    Cancelled = 8,
    // Lock configuration, rejected before the store is contacted.
    InvalidExpire = 20,
    InvalidTimeout = 21,
    TimeoutTooLarge = 22,
    TimeoutNotUsable = 23,
    RenewalWithoutExpire = 24,
    InvalidLockName = 25,
    // Lock ownership.
    AlreadyAcquired = 30,
    NotAcquired = 31,
    NotExpirable = 32,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

extern const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes;
bool isRetriable(const std::string& op, const ErrorCode& code);

[[nodiscard]] bool isConfigurationError(const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string key;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string k);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& details);
};

} // namespace zlock

#endif // ZLOCK_COMMON_ERROR_HPP
