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


#include "common/RetryPolicy.hpp"
#include <stdexcept>
#include <string>
#include <chrono>

namespace zlock {

namespace {

template<typename Rep, typename Period>
void requireNonNegative(std::chrono::duration<Rep, Period> d, const std::string& what) {
    if (d < std::chrono::duration<Rep, Period>::zero()) {
        throw std::invalid_argument("RetryPolicy: " + what + " must be >= zero.");
    }
}

} // namespace

RetryPolicy::RetryPolicy(
    std::chrono::microseconds base,
    std::chrono::microseconds max,
    std::chrono::microseconds reset,
    int threshold,
    int attempts,
    std::chrono::milliseconds rpc,
    std::chrono::milliseconds channel)
    : baseDelay(base),
      maxDelay(max),
      resetTimeout(reset),
      failureThreshold(threshold),
      connectAttempts(attempts),
      rpcTimeout(rpc),
      channelTimeout(channel) {
    if (threshold < 0) {
        throw std::invalid_argument("RetryPolicy: failure threshold must be >= zero.");
    }
    if (attempts < 0) {
        throw std::invalid_argument("RetryPolicy: connect attempts must be >= zero.");
    }
    requireNonNegative(base, "base delay");
    requireNonNegative(max, "max delay");
    requireNonNegative(reset, "reset timeout");
    requireNonNegative(rpc, "RPC timeout");
    requireNonNegative(channel, "channel timeout");
    if (max < base) {
        throw std::invalid_argument("RetryPolicy: max delay must be >= base delay.");
    }
}

} // namespace zlock
