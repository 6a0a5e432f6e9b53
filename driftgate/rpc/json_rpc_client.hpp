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

#ifndef DRIFTGATE_RPC_JSON_RPC_CLIENT_HPP_
#define DRIFTGATE_RPC_JSON_RPC_CLIENT_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <nlohmann/json.hpp>

#include <driftgate/common/constants.hpp>
#include <driftgate/rpc/interfaces.hpp>
#include <driftgate/rpc/json_rpc.hpp>

namespace driftgate::rpc {

struct RpcClientSettings {
    std::string url{kDefaultRpcUrl};
    std::chrono::milliseconds request_timeout{kDefaultRpcTimeout};
    std::chrono::milliseconds confirm_timeout{kDefaultConfirmTimeout};
    std::chrono::milliseconds poll_interval{kDefaultConfirmPollInterval};
};

//! Solana JSON-RPC 2.0 over HTTP(S), one connection per request.
class JsonRpcClient : public TransactionSource, public TransactionSender, public SignatureSource {
  public:
    explicit JsonRpcClient(RpcClientSettings settings);

    boost::asio::awaitable<FetchedTransaction> get_transaction(const std::string& signature, const std::string& commitment) override;

    boost::asio::awaitable<std::string> send_and_confirm(const Bytes& signed_transaction,
                                                         const std::string& commitment,
                                                         bool skip_preflight) override;

    boost::asio::awaitable<std::vector<SignatureInfo>> get_signatures_for_address(
        const std::string& address, const std::optional<std::string>& before, std::size_t limit) override;

    //! Perform one JSON-RPC call and return its result. Throws RpcError.
    boost::asio::awaitable<nlohmann::json> call(const std::string& method, const nlohmann::json& params);

  private:
    boost::asio::awaitable<void> wait_for_confirmation(const std::string& signature, const std::string& commitment);
    boost::asio::awaitable<std::string> post(std::string body);

    RpcClientSettings settings_;
    Endpoint endpoint_;
    boost::asio::ssl::context ssl_context_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace driftgate::rpc

#endif // DRIFTGATE_RPC_JSON_RPC_CLIENT_HPP_
