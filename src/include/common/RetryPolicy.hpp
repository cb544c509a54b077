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


#ifndef ZLOCK_COMMON_RETRY_POLICY_HPP
#define ZLOCK_COMMON_RETRY_POLICY_HPP

#include <chrono>

namespace zlock {

struct RetryPolicy {
    RetryPolicy(
        std::chrono::microseconds base,
        std::chrono::microseconds max,
        std::chrono::microseconds reset,
        int threshold,
        int attempts,
        std::chrono::milliseconds rpc,
        std::chrono::milliseconds channel
    );
    std::chrono::microseconds baseDelay;
    std::chrono::microseconds maxDelay;
    std::chrono::microseconds resetTimeout;
    int failureThreshold;
    // Calls made against the store before giving up; at least one is made.
    int connectAttempts;
    std::chrono::milliseconds rpcTimeout;
    std::chrono::milliseconds channelTimeout;
};

} // namespace zlock

#endif // ZLOCK_COMMON_RETRY_POLICY_HPP
