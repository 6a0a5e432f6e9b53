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

#ifndef DRIFTGATE_EXECUTION_TX_EXECUTOR_HPP_
#define DRIFTGATE_EXECUTION_TX_EXECUTOR_HPP_

#include <string>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>

#include <driftgate/common/constants.hpp>
#include <driftgate/concurrency/async_mutex.hpp>
#include <driftgate/crypto/keypair.hpp>
#include <driftgate/rpc/interfaces.hpp>
#include <driftgate/types/transaction.hpp>

namespace driftgate::execution {

struct ExecutorSettings {
    std::string commitment{kCommitmentConfirmed};
    bool skip_preflight{false};
};

//! Signs worker-built transactions with the server key and submits them, one at a time.
class TxExecutor {
  public:
    TxExecutor(rpc::TransactionSender& sender, crypto::Keypair keypair, ExecutorSettings settings = {});

    TxExecutor(const TxExecutor&) = delete;
    TxExecutor& operator=(const TxExecutor&) = delete;

    const PublicKey& public_key() const noexcept { return keypair_.public_key(); }
    std::string public_key_base58() const { return keypair_.public_key().to_base58(); }

    //! Decode, sign and submit the base64 transaction, returning its base58 signature once confirmed.
    //! Throws ExecutorError(decode) before any network call, ExecutorError(rpc) if submission fails.
    boost::asio::awaitable<std::string> execute(std::string tx_base64);

    //! Decode the base64 transaction and install the server signature in slot 0. Throws ExecutorError(decode).
    VersionedTransaction sign(const std::string& tx_base64) const;

  private:
    rpc::TransactionSender& sender_;
    crypto::Keypair keypair_;
    ExecutorSettings settings_;
    concurrency::AsyncMutex mutex_;
};

} // namespace driftgate::execution

#endif // DRIFTGATE_EXECUTION_TX_EXECUTOR_HPP_
