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


#ifndef ZLOCK_COMMON_CIRCUIT_BREAKER_HPP
#define ZLOCK_COMMON_CIRCUIT_BREAKER_HPP

#include <functional>
#include "common/RetryPolicy.hpp"
#include "common/Repeater.hpp"
#include <grpcpp/support/status.h>
#include <vector>
#include <string>
#include <chrono>
#include <atomic>
#include <mutex>

namespace zlock {

class CircuitBreaker {
public:
    enum class State : char {
        Open,
        Closed,
        HalfOpen
    };
    CircuitBreaker(const RetryPolicy p, std::atomic<bool>& sc);
    std::vector<grpc::Status> call(const std::string& op, const std::function<grpc::Status()>& rpc);
    [[nodiscard]] bool open();
private:
    void recordFailure(const std::string& op, const grpc::Status& status);
    // The rpc itself always runs without m held; a blocking pop must not stall
    // other callers sharing this breaker.
    std::mutex m;
    State state;
    RetryPolicy policy;
    Repeater repeater;
    std::chrono::steady_clock::time_point lastFailureTime;
};

} // namespace zlock

#endif // ZLOCK_COMMON_CIRCUIT_BREAKER_HPP
