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


#ifndef ZLOCK_COMMON_RPC_SERVICE_HPP
#define ZLOCK_COMMON_RPC_SERVICE_HPP

#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/RetryPolicy.hpp"
#include "common/TypesMap.hpp"
#include <grpcpp/grpcpp.h>
#include <expected>
#include <memory>
#include <functional>
#include <chrono>
#include <algorithm>
#include <iterator>
#include <string>
#include <mutex>
#include <atomic>
#include <vector>
#include <unordered_map>

namespace zlock {

// One remote endpoint: a lazily connected channel, its stub, and the circuit
// breaker every call to it goes through.
template<typename Service>
class RPCService {
public:
    using Stub = typename Service::Stub;
    using function_t = std::function<grpc::Status(std::shared_ptr<Stub>, grpc::ClientContext*, const google::protobuf::Message&, google::protobuf::Message*)>;
    RPCService(const std::string& address, const RetryPolicy p, std::unordered_map<std::string, function_t> f, std::atomic<bool>& sc);
    RPCService(const RPCService&) = delete;
    RPCService& operator=(const RPCService&) = delete;
    std::expected<std::monostate, Error> connect();
    // extra is added to the policy's rpc deadline, for calls that block on the
    // server side.
    template<typename Req, typename Rep = map_to_t<Req>>
    std::expected<Rep, std::vector<Error>> call(
        const std::string& op,
        const Req& request,
        std::chrono::milliseconds extra = std::chrono::milliseconds::zero()) {
        function_t f;
        std::shared_ptr<Stub> s;
        {
            if (!connected()) {
                return std::unexpected(std::vector<Error>{Error{ErrorCode::ServiceTemporarilyUnavailable, "Not connected"}});
            }
            std::lock_guard<std::mutex> lock {m};
            auto it = functions.find(op);
            if (it == functions.end() || !it->second) {
                return std::unexpected(std::vector<Error>{Error{ErrorCode::Unknown, "Unknown operation: " + op}});
            }
            f = it->second;
            s = stub;
        }
        auto reply = Rep{};
        auto bound = [f, s, &request, &reply, timeout = policy.rpcTimeout + extra] {
            grpc::ClientContext c {};
            c.set_deadline(std::chrono::system_clock::now() + timeout);
            return f(s, &c, request, &reply);
        };
        auto statuses = circuitBreaker.call(op, bound);
        if (statuses.back().ok()) {
            return reply;
        }
        std::vector<Error> errors;
        errors.reserve(statuses.size());
        std::transform(statuses.begin(), statuses.end(), std::back_inserter(errors), [](const grpc::Status& st) {
            return toError(st);
        });
        return std::unexpected {errors};
    }
    [[nodiscard]] bool available();
    [[nodiscard]] bool connected() const;
    [[nodiscard]] std::string address() const;
private:
    mutable std::mutex m;
    std::string addr;
    RetryPolicy policy;
    CircuitBreaker circuitBreaker;
    std::unordered_map<std::string, function_t> functions;
    std::shared_ptr<grpc::Channel> channel;
    std::shared_ptr<Stub> stub;
};

template<typename Service>
RPCService<Service>::RPCService(const std::string& address, const RetryPolicy p, std::unordered_map<std::string, function_t> f, std::atomic<bool>& sc)
    : addr {address},
      policy {p},
      circuitBreaker {p, sc},
      functions {std::move(f)} {}

template<typename Service>
std::expected<std::monostate, Error> RPCService<Service>::connect() {
    std::lock_guard<std::mutex> lock {m};
    if (channel) {
        auto state = channel->GetState(false);
        if (state == GRPC_CHANNEL_READY && stub) {
            return {};
        }
        if (state != GRPC_CHANNEL_SHUTDOWN &&
            channel->WaitForConnected(std::chrono::system_clock::now() + policy.channelTimeout)) {
            stub = Service::NewStub(channel);
            return {};
        }
    }
    channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + policy.channelTimeout)) {
        return std::unexpected {Error{ErrorCode::ServiceTemporarilyUnavailable, "Could not connect to service @" + addr}};
    }
    stub = Service::NewStub(channel);
    return {};
}

template<typename Service>
bool RPCService<Service>::available() {
    if (circuitBreaker.open()) {
        return false;
    }
    if (!connected()) {
        return connect().has_value();
    }
    return true;
}

template<typename Service>
bool RPCService<Service>::connected() const {
    std::lock_guard<std::mutex> lock {m};
    if (!channel || !stub) {
        return false;
    }
    return channel->GetState(false) == GRPC_CHANNEL_READY;
}

template<typename Service>
std::string RPCService<Service>::address() const {
    return addr;
}

} // namespace zlock

#endif // ZLOCK_COMMON_RPC_SERVICE_HPP
