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

#ifndef DRIFTGATE_TYPES_TRANSACTION_HPP_
#define DRIFTGATE_TYPES_TRANSACTION_HPP_

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <vector>

#include <driftgate/common/base.hpp>
#include <driftgate/types/pubkey.hpp>

namespace driftgate {

struct MessageHeader {
    uint8_t num_required_signatures{0};
    uint8_t num_readonly_signed_accounts{0};
    uint8_t num_readonly_unsigned_accounts{0};
};

struct CompiledInstruction {
    uint8_t program_id_index{0};
    std::vector<uint8_t> accounts;
    Bytes data;
};

struct AddressTableLookup {
    PublicKey account_key;
    std::vector<uint8_t> writable_indexes;
    std::vector<uint8_t> readonly_indexes;
};

struct Message {
    /* empty for legacy messages */
    std::optional<uint8_t> version;
    MessageHeader header;
    std::vector<PublicKey> account_keys;
    std::array<uint8_t, kPublicKeyLength> recent_blockhash{};
    std::vector<CompiledInstruction> instructions;
    std::vector<AddressTableLookup> address_table_lookups;

    bool is_signer(std::size_t index) const noexcept;

    //! Writability of index in the combined key table: static keys, then loaded writable, then loaded readonly.
    bool is_writable(std::size_t index, std::size_t loaded_writable_count) const noexcept;
};

struct VersionedTransaction {
    std::vector<Signature> signatures;
    Message message;
};

std::ostream& operator<<(std::ostream& out, const Message& message);

//! Parse wire bytes, throws decoding::DecodeError on truncation, trailing bytes or unsupported version
VersionedTransaction decode_transaction(ByteView data);

Bytes encode_message(const Message& message);
Bytes encode_transaction(const VersionedTransaction& transaction);

} // namespace driftgate

#endif // DRIFTGATE_TYPES_TRANSACTION_HPP_
