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

#include "gateway.hpp"

#include <utility>

#include <driftgate/common/log.hpp>
#include <driftgate/ipc/error.hpp>

namespace driftgate {

boost::asio::awaitable<nlohmann::json> Gateway::build(std::string function, nlohmann::json args) {
    DRIFTGATE_DEBUG << "Gateway::build fn: " << function << "\n";
    co_return co_await bridge_.submit(std::move(function), std::move(args), timeout_);
}

boost::asio::awaitable<nlohmann::json> Gateway::build_and_execute(std::string function, nlohmann::json args) {
    auto result = co_await bridge_.submit(function, std::move(args), timeout_);

    const auto tx_base64 = result.find(kTxBase64Field);
    if (tx_base64 == result.end() || !tx_base64->is_string()) {
        throw ipc::IpcError{ipc::IpcErrc::protocol, function + " result missing " + kTxBase64Field};
    }

    const auto signature = co_await executor_.execute(tx_base64->get<std::string>());
    DRIFTGATE_INFO << "Gateway: " << function << " executed signature: " << signature << "\n";
    result[kTxSignatureField] = signature;
    co_return result;
}

} // namespace driftgate
