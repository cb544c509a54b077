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


#ifndef ZLOCK_COMMON_EXPONENTIAL_BACKOFF_HPP
#define ZLOCK_COMMON_EXPONENTIAL_BACKOFF_HPP

#include "common/RetryPolicy.hpp"
#include <optional>
#include <chrono>

namespace zlock {

class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const RetryPolicy policy);
    std::optional<std::chrono::microseconds> nextDelay();
    void reset();
private:
    RetryPolicy policy;
    int attempt{0};
};

} // namespace zlock

#endif // ZLOCK_COMMON_EXPONENTIAL_BACKOFF_HPP
