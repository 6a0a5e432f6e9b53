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

#ifndef DRIFTGATE_GATEWAY_HPP_
#define DRIFTGATE_GATEWAY_HPP_

#include <chrono>
#include <string>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <driftgate/common/constants.hpp>
#include <driftgate/execution/tx_executor.hpp>
#include <driftgate/ipc/bridge.hpp>

namespace driftgate {

//! Builds transactions through the worker and executes them with the server key.
class Gateway {
  public:
    Gateway(ipc::WorkerBridge& bridge, execution::TxExecutor& executor, std::chrono::milliseconds timeout = kDefaultWorkerTimeout)
        : bridge_(bridge), executor_(executor), timeout_{timeout} {}

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    //! Worker result of \p function, passed through untouched
    boost::asio::awaitable<nlohmann::json> build(std::string function, nlohmann::json args);

    //! Build, then sign and submit the txBase64 field of the worker result. The returned object gains txSignature.
    //! Throws IpcError(protocol) if the result carries no txBase64 string.
    boost::asio::awaitable<nlohmann::json> build_and_execute(std::string function, nlohmann::json args);

  private:
    ipc::WorkerBridge& bridge_;
    execution::TxExecutor& executor_;
    std::chrono::milliseconds timeout_;
};

} // namespace driftgate

#endif // DRIFTGATE_GATEWAY_HPP_
