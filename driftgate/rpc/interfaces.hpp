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

#ifndef DRIFTGATE_RPC_INTERFACES_HPP_
#define DRIFTGATE_RPC_INTERFACES_HPP_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>

#include <driftgate/common/base.hpp>
#include <driftgate/types/fetched_transaction.hpp>

namespace driftgate::rpc {

class TransactionSource {
  public:
    TransactionSource() = default;
    virtual ~TransactionSource() = default;

    TransactionSource(const TransactionSource&) = delete;
    TransactionSource& operator=(const TransactionSource&) = delete;

    virtual boost::asio::awaitable<FetchedTransaction> get_transaction(const std::string& signature, const std::string& commitment) = 0;
};

class TransactionSender {
  public:
    TransactionSender() = default;
    virtual ~TransactionSender() = default;

    TransactionSender(const TransactionSender&) = delete;
    TransactionSender& operator=(const TransactionSender&) = delete;

    //! Submit the wire-encoded signed transaction and wait until it reaches the commitment level.
    //! Returns the base58 transaction signature.
    virtual boost::asio::awaitable<std::string> send_and_confirm(const Bytes& signed_transaction,
                                                                 const std::string& commitment,
                                                                 bool skip_preflight) = 0;
};

struct SignatureInfo {
    std::string signature;
    uint64_t slot{0};
    std::optional<int64_t> block_time;
    bool failed{false};
};

class SignatureSource {
  public:
    SignatureSource() = default;
    virtual ~SignatureSource() = default;

    SignatureSource(const SignatureSource&) = delete;
    SignatureSource& operator=(const SignatureSource&) = delete;

    //! Newest first, starting strictly before the given signature when present.
    virtual boost::asio::awaitable<std::vector<SignatureInfo>> get_signatures_for_address(
        const std::string& address, const std::optional<std::string>& before, std::size_t limit) = 0;
};

} // namespace driftgate::rpc

#endif // DRIFTGATE_RPC_INTERFACES_HPP_
