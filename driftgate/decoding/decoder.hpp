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

#ifndef DRIFTGATE_DECODING_DECODER_HPP_
#define DRIFTGATE_DECODING_DECODER_HPP_

#include <string>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>

#include <driftgate/rpc/interfaces.hpp>
#include <driftgate/types/action.hpp>
#include <driftgate/types/fetched_transaction.hpp>
#include <driftgate/types/pubkey.hpp>

namespace driftgate::decoding {

PublicKey default_program_id();

struct DecoderSettings {
    PublicKey program_id{default_program_id()};
};

struct DecodeResult {
    SignatureDump dump;
    std::vector<ActionRecord> actions;
};

//! Turns confirmed transactions into per-instruction dumps and action records for the configured program.
//! Holds no mutable state: concurrent decode_signature calls are independent.
class Decoder {
  public:
    explicit Decoder(rpc::TransactionSource& source, DecoderSettings settings = {});

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    const DecoderSettings& settings() const noexcept { return settings_; }

    //! Fetch at confirmed commitment and decode. Throws DecodeError if the signature or transaction is malformed.
    boost::asio::awaitable<DecodeResult> decode_signature(std::string signature) const;

    DecodeResult decode_fetched(const std::string& signature, const FetchedTransaction& fetched) const;

  private:
    rpc::TransactionSource& source_;
    DecoderSettings settings_;
};

} // namespace driftgate::decoding

#endif // DRIFTGATE_DECODING_DECODER_HPP_
