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


#include "common/Repeater.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/ExponentialBackoff.hpp"
#include "common/Util.hpp"
#include "common/RetryPolicy.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <random>
#include <chrono>
#include <thread>
#include <grpcpp/support/status.h>
#include <vector>
#include <string>

namespace zlock {

namespace {

// Full jitter: uniform in [0, delay].
std::chrono::microseconds jittered(std::chrono::microseconds delay) {
    thread_local auto rng = random_generator();
    std::uniform_int_distribution<std::chrono::microseconds::rep> dist(0, std::max(delay.count(), std::chrono::microseconds::rep{0}));
    return std::chrono::microseconds(dist(rng));
}

} // namespace

Repeater::Repeater(const RetryPolicy p, std::atomic<bool>& sc)
    : policy {p},
      stopCalls {sc} {}

std::vector<grpc::Status> Repeater::attempt(const std::string& op, const std::function<grpc::Status()>& rpc) const {
    std::vector<grpc::Status> statuses;
    ExponentialBackoff backoff {policy};
    while (!stopCalls.load(std::memory_order_acquire)) {
        auto status = rpc();
        statuses.push_back(status);
        if (status.ok() || !isRetriable(op, toError(status).code)) {
            return statuses;
        }
        auto delay = backoff.nextDelay();
        if (!delay.has_value()) {
            return statuses;
        }
        auto remaining = jittered(delay.value());
        while (!stopCalls.load(std::memory_order_acquire) && remaining > std::chrono::microseconds::zero()) {
            auto step = std::min<std::chrono::microseconds>(remaining, std::chrono::microseconds{1000});
            std::this_thread::sleep_for(step);
            remaining -= step;
        }
    }
    statuses.push_back(grpc::Status{grpc::StatusCode::CANCELLED, "Repeater stopped"});
    return statuses;
}

} // namespace zlock
