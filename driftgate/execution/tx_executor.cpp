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

#include "tx_executor.hpp"

#include <utility>

#include <boost/system/system_error.hpp>

#include <driftgate/common/log.hpp>
#include <driftgate/common/util.hpp>
#include <driftgate/decoding/error.hpp>
#include <driftgate/execution/error.hpp>
#include <driftgate/rpc/error.hpp>

namespace driftgate::execution {

TxExecutor::TxExecutor(rpc::TransactionSender& sender, crypto::Keypair keypair, ExecutorSettings settings)
    : sender_(sender), keypair_{std::move(keypair)}, settings_{std::move(settings)} {}

VersionedTransaction TxExecutor::sign(const std::string& tx_base64) const {
    const auto wire = base64_decode(trim(tx_base64));
    if (!wire) {
        throw ExecutorError{ExecutorErrc::decode, "invalid base64 transaction"};
    }

    VersionedTransaction transaction;
    try {
        transaction = decode_transaction(*wire);
    } catch (const decoding::DecodeError& e) {
        throw ExecutorError{ExecutorErrc::decode, e.what()};
    }

    const auto& message = transaction.message;
    if (message.header.num_required_signatures == 0 || message.account_keys.empty() || message.account_keys[0] != public_key()) {
        throw ExecutorError{ExecutorErrc::decode, "transaction does not designate server key as fee payer"};
    }

    const auto signature = keypair_.sign(encode_message(message));
    if (transaction.signatures.empty()) {
        transaction.signatures.resize(message.header.num_required_signatures);
    }
    transaction.signatures[0] = signature;
    return transaction;
}

boost::asio::awaitable<std::string> TxExecutor::execute(std::string tx_base64) {
    const auto guard = co_await concurrency::scoped_lock(mutex_);

    const auto transaction = sign(tx_base64);
    const auto signature = transaction.signatures[0].to_base58();
    DRIFTGATE_DEBUG << "TxExecutor::execute submitting signature: " << signature << "\n";

    std::string confirmed;
    try {
        confirmed = co_await sender_.send_and_confirm(encode_transaction(transaction), settings_.commitment, settings_.skip_preflight);
    } catch (const rpc::RpcError& e) {
        if (e.is_preflight_failure()) {
            DRIFTGATE_ERROR << "TxExecutor: transaction preflight failure signature: " << signature << " error: " << e.what() << "\n";
        } else {
            DRIFTGATE_ERROR << "TxExecutor: rpc error signature: " << signature << " error: " << e.what() << "\n";
        }
        throw ExecutorError{ExecutorErrc::rpc, e.what()};
    } catch (const boost::system::system_error& e) {
        DRIFTGATE_ERROR << "TxExecutor: transport error signature: " << signature << " error: " << e.what() << "\n";
        throw ExecutorError{ExecutorErrc::rpc, e.what()};
    }

    DRIFTGATE_INFO << "TxExecutor: transaction executed signature: " << confirmed << "\n";
    co_return confirmed;
}

} // namespace driftgate::execution
