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


#ifndef ZLOCK_COMMON_REPEATER_HPP
#define ZLOCK_COMMON_REPEATER_HPP

#include <functional>
#include "common/RetryPolicy.hpp"
#include <grpcpp/support/status.h>
#include <vector>
#include <string>
#include <atomic>

namespace zlock {

// Retries one rpc with exponential backoff and full jitter while its failures are
// retriable for op. Backoff state is per attempt() so concurrent callers do not
// share it.
class Repeater {
public:
    Repeater(const RetryPolicy p, std::atomic<bool>& sc);
    std::vector<grpc::Status> attempt(const std::string& op, const std::function<grpc::Status()>& rpc) const;
private:
    RetryPolicy policy;
    std::atomic<bool>& stopCalls;
};

} // namespace zlock

#endif // ZLOCK_COMMON_REPEATER_HPP
