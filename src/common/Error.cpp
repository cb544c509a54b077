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


#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <unordered_set>
#include <unordered_map>

namespace zlock {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::ServiceTemporarilyUnavailable: return "ServiceTemporarilyUnavailable";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::WrongType: return "WrongType";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidExpire: return "InvalidExpire";
        case ErrorCode::InvalidTimeout: return "InvalidTimeout";
        case ErrorCode::TimeoutTooLarge: return "TimeoutTooLarge";
        case ErrorCode::TimeoutNotUsable: return "TimeoutNotUsable";
        case ErrorCode::RenewalWithoutExpire: return "RenewalWithoutExpire";
        case ErrorCode::InvalidLockName: return "InvalidLockName";
        case ErrorCode::AlreadyAcquired: return "AlreadyAcquired";
        case ErrorCode::NotAcquired: return "NotAcquired";
        case ErrorCode::NotExpirable: return "NotExpirable";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

// A retried setIfAbsent or eraseIfEquals whose first reply was lost would report
// AlreadyAcquired or NotAcquired for an operation that actually succeeded, and a
// retried blockingPop may swallow a wake token. Those are never retried.
const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes = {
    {"setIfAbsent", {}},
    {"eraseIfEquals", {}},
    {"blockingPop", {}},
    {"default", {
        ErrorCode::Unknown,
        ErrorCode::ServiceTemporarilyUnavailable,
        ErrorCode::Timeout,
    }}
};

bool isRetriable(const std::string& op, const ErrorCode& code) {
    auto it = retriableErrorCodes.find(op);
    if (it != retriableErrorCodes.end()) {
        return it->second.contains(code);
    }
    auto d = retriableErrorCodes.find("default");
    return d->second.contains(code);
}

bool isConfigurationError(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::InvalidExpire:
        case ErrorCode::InvalidTimeout:
        case ErrorCode::TimeoutTooLarge:
        case ErrorCode::TimeoutNotUsable:
        case ErrorCode::RenewalWithoutExpire:
        case ErrorCode::InvalidLockName:
            return true;
        default:
            return false;
    }
}

Error::Error(const ErrorCode& c, std::string w, std::string k) : code {c}, what {std::move(w)}, key {std::move(k)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, key {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, key {} {}
Error::Error(const proto::ErrorDetails& details)
    : code {static_cast<ErrorCode>(details.code())},
      what {details.what()},
      key {details.key()} {}

} // namespace zlock
