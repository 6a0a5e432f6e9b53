/*
   Copyright 2022 The Driftgate Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#ifndef DRIFTGATE_IPC_BRIDGE_HPP_
#define DRIFTGATE_IPC_BRIDGE_HPP_

#include <chrono>
#include <string>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

namespace driftgate::ipc {

//! Request/response channel to the transaction builder worker.
class WorkerBridge {
  public:
    WorkerBridge() = default;
    virtual ~WorkerBridge() = default;

    WorkerBridge(const WorkerBridge&) = delete;
    WorkerBridge& operator=(const WorkerBridge&) = delete;

    //! Call \p function with \p args and return its result. Throws IpcError.
    virtual boost::asio::awaitable<nlohmann::json> submit(std::string function, nlohmann::json args, std::chrono::milliseconds timeout) = 0;
};

} // namespace driftgate::ipc

#endif // DRIFTGATE_IPC_BRIDGE_HPP_
