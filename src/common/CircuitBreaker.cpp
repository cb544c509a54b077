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


#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <grpcpp/support/status.h>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>
#include <string>

namespace zlock {

CircuitBreaker::CircuitBreaker(const RetryPolicy p, std::atomic<bool>& sc)
    : state{State::Closed},
      policy{p},
      repeater{p, sc} {}

std::vector<grpc::Status> CircuitBreaker::call(const std::string& op, const std::function<grpc::Status()>& rpc) {
    State current;
    {
        std::lock_guard lock {m};
        if (state == State::Open) {
            if (std::chrono::steady_clock::now() - lastFailureTime < policy.resetTimeout) {
                return {grpc::Status(grpc::StatusCode::UNAVAILABLE, "Circuit breaker is open")};
            }
            state = State::HalfOpen;
        }
        current = state;
    }
    if (current == State::HalfOpen) {
        auto status = rpc();
        if (status.ok()) {
            std::lock_guard lock {m};
            state = State::Closed;
        } else {
            spdlog::warn("CircuitBreaker: half-open probe for {} failed: {} {}", op, static_cast<int>(status.error_code()), status.error_message());
            recordFailure(op, status);
        }
        return {status};
    }
    auto statuses = repeater.attempt(op, rpc);
    if (!statuses.back().ok()) {
        spdlog::warn("CircuitBreaker: {} failed: {} {}", op, static_cast<int>(statuses.back().error_code()), statuses.back().error_message());
        recordFailure(op, statuses.back());
    }
    return statuses;
}

void CircuitBreaker::recordFailure(const std::string& op, const grpc::Status& status) {
    std::lock_guard lock {m};
    if (isRetriable("default", toError(status).code)) {
        lastFailureTime = std::chrono::steady_clock::now();
        state = State::Open;
        spdlog::warn("CircuitBreaker: opening after {} failure", op);
    } else {
        state = State::Closed;
    }
}

bool CircuitBreaker::open() {
    std::lock_guard lock {m};
    if (state == State::Open && std::chrono::steady_clock::now() - lastFailureTime >= policy.resetTimeout) {
        state = State::HalfOpen;
    }
    return state == State::Open;
}

} // namespace zlock
