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


#ifndef ZLOCK_LOCK_RENEWAL_SCHEDULER_HPP
#define ZLOCK_LOCK_RENEWAL_SCHEDULER_HPP

#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <condition_variable>
#include <cstdint>

namespace zlock {

// Runs tick every interval on a worker thread until stop() or until tick returns
// false. tick may itself call stop() and start(); the worker it runs on is then
// joined by the next stop() made from another thread.
class RenewalScheduler {
public:
    RenewalScheduler();
    void start(std::chrono::milliseconds interval, std::function<bool()> tick);
    // Returns once the worker has exited, unless called from the worker itself.
    void stop();
    [[nodiscard]] bool running() const;
    ~RenewalScheduler();
    RenewalScheduler(const RenewalScheduler&) = delete;
    RenewalScheduler& operator=(const RenewalScheduler&) = delete;
    RenewalScheduler(RenewalScheduler&&) = delete;
    RenewalScheduler& operator=(RenewalScheduler&&) = delete;
private:
    std::atomic<bool> active;
    // Bumped by every stop(); a worker runs while it still matches its own.
    std::uint64_t generation;
    std::mutex mtx;
    std::condition_variable cv;
    // Guards worker and retired.
    std::mutex control;
    std::thread worker;
    // A worker that stopped itself.
    std::thread retired;
};

} // namespace zlock

#endif // ZLOCK_LOCK_RENEWAL_SCHEDULER_HPP
