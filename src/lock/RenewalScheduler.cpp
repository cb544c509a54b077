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


#include "lock/RenewalScheduler.hpp"
#include <thread>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace zlock {

RenewalScheduler::RenewalScheduler() : active{false}, generation{0}, mtx{}, cv{}, control{} {}

void RenewalScheduler::start(std::chrono::milliseconds interval, std::function<bool()> tick) {
    if (interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("RenewalScheduler: interval must be > zero.");
    }
    stop();
    std::lock_guard<std::mutex> guard(control);
    std::uint64_t mine = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        mine = generation;
        active = true;
    }
    worker = std::thread([this, interval, mine, tick = std::move(tick)]() {
        while (true) {
            std::unique_lock<std::mutex> lock(mtx);
            if (cv.wait_for(lock, interval, [this, mine]{ return generation != mine; })) {
                break;
            }
            lock.unlock();
            if (!tick()) {
                break;
            }
        }
        std::lock_guard<std::mutex> lock(mtx);
        if (generation == mine) {
            active = false;
        }
    });
}

void RenewalScheduler::stop() {
    std::thread finished;
    std::thread previous;
    {
        std::lock_guard<std::mutex> guard(control);
        {
            std::lock_guard<std::mutex> lock(mtx);
            ++generation;
            active = false;
        }
        cv.notify_all();
        if (retired.joinable() && retired.get_id() != std::this_thread::get_id()) {
            previous = std::move(retired);
        }
        if (worker.joinable()) {
            if (worker.get_id() == std::this_thread::get_id()) {
                retired = std::move(worker);
            } else {
                finished = std::move(worker);
            }
        }
    }
    if (finished.joinable()) {
        finished.join();
    }
    if (previous.joinable()) {
        previous.join();
    }
}

bool RenewalScheduler::running() const {
    return active;
}

RenewalScheduler::~RenewalScheduler() {
    stop();
    // Destroyed from inside its own tick.
    if (retired.joinable()) {
        retired.detach();
    }
}

} // namespace zlock
