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


#include <csignal>
#include <memory>
#include <vector>
#include <string>
#include <exception>
#include <pthread.h>
#include "storage/InMemoryLockStore.hpp"
#include "server/LockStoreServiceImpl.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/common.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

using zlock::InMemoryLockStore;
using zlock::LockStoreServiceImpl;
using zlock::LockStoreServer;

namespace {

void installLogger(spdlog::level::level_enum level) {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/zlockd.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "zlockd", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    asyncLogger->set_level(level);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);
}

} // namespace

// zlockd [listen-address] [log-level]
int main(int argc, char** argv) {
    const std::string listenAddress {argc > 1 ? argv[1] : "0.0.0.0:50051"};
    const auto level = spdlog::level::from_str(argc > 2 ? argv[2] : "info");

    // Every thread started from here on inherits the mask, so only sigwait
    // below sees the shutdown signals.
    sigset_t shutdownSignals;
    sigemptyset(&shutdownSignals);
    sigaddset(&shutdownSignals, SIGINT);
    sigaddset(&shutdownSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdownSignals, nullptr);

    installLogger(level);
    int status = 0;
    try {
        InMemoryLockStore store {};
        LockStoreServiceImpl service {store};
        LockStoreServer server {listenAddress, service};
        spdlog::info("zlockd listening on {} (port {})", listenAddress, server.port());
        int received = 0;
        sigwait(&shutdownSignals, &received);
        spdlog::info("zlockd received signal {}, shutting down", received);
        server.shutdown();
    } catch (const std::exception& e) {
        spdlog::critical("zlockd: {}", e.what());
        status = 1;
    }
    spdlog::shutdown();
    return status;
}
