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

#include "transaction.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <driftgate/decoding/borsh.hpp>

namespace driftgate {

namespace {

constexpr uint8_t kVersionPrefixMask{0x80};

std::vector<uint8_t> read_index_list(decoding::BorshReader& reader) {
    const auto length = reader.read_shortvec_length();
    const auto bytes = reader.read_bytes(length);
    return {bytes.begin(), bytes.end()};
}

PublicKey read_public_key(decoding::BorshReader& reader) {
    PublicKey key;
    const auto bytes = reader.read_bytes(kPublicKeyLength);
    std::copy(bytes.begin(), bytes.end(), key.bytes.begin());
    return key;
}

Message read_message(decoding::BorshReader& reader) {
    Message message;
    const auto first = reader.read_u8();
    if (first & kVersionPrefixMask) {
        const uint8_t version = first & ~kVersionPrefixMask;
        if (version != 0) {
            throw decoding::DecodeError{"unsupported transaction version " + std::to_string(version)};
        }
        message.version = version;
        message.header.num_required_signatures = reader.read_u8();
    } else {
        message.header.num_required_signatures = first;
    }
    message.header.num_readonly_signed_accounts = reader.read_u8();
    message.header.num_readonly_unsigned_accounts = reader.read_u8();

    const auto key_count = reader.read_shortvec_length();
    message.account_keys.reserve(key_count);
    for (std::size_t i{0}; i < key_count; ++i) {
        message.account_keys.push_back(read_public_key(reader));
    }

    const auto blockhash = reader.read_bytes(kPublicKeyLength);
    std::copy(blockhash.begin(), blockhash.end(), message.recent_blockhash.begin());

    const auto instruction_count = reader.read_shortvec_length();
    message.instructions.reserve(instruction_count);
    for (std::size_t i{0}; i < instruction_count; ++i) {
        CompiledInstruction instruction;
        instruction.program_id_index = reader.read_u8();
        instruction.accounts = read_index_list(reader);
        const auto data_length = reader.read_shortvec_length();
        instruction.data = Bytes{reader.read_bytes(data_length)};
        message.instructions.push_back(std::move(instruction));
    }

    if (message.version) {
        const auto lookup_count = reader.read_shortvec_length();
        for (std::size_t i{0}; i < lookup_count; ++i) {
            AddressTableLookup lookup;
            lookup.account_key = read_public_key(reader);
            lookup.writable_indexes = read_index_list(reader);
            lookup.readonly_indexes = read_index_list(reader);
            message.address_table_lookups.push_back(std::move(lookup));
        }
    }
    return message;
}

void write_index_list(decoding::BorshWriter& writer, const std::vector<uint8_t>& indexes) {
    writer.write_shortvec_length(static_cast<uint16_t>(indexes.size()));
    writer.write_bytes({indexes.data(), indexes.size()});
}

} // namespace

bool Message::is_signer(std::size_t index) const noexcept {
    return index < header.num_required_signatures;
}

bool Message::is_writable(std::size_t index, std::size_t loaded_writable_count) const noexcept {
    const std::size_t static_count = account_keys.size();
    if (index < static_count) {
        if (index < header.num_required_signatures) {
            return index < std::size_t(header.num_required_signatures - header.num_readonly_signed_accounts);
        }
        return index < static_count - header.num_readonly_unsigned_accounts;
    }
    return index < static_count + loaded_writable_count;
}

std::ostream& operator<<(std::ostream& out, const Message& message) {
    if (message.version) {
        out << "version: " << int(*message.version);
    } else {
        out << "version: legacy";
    }
    out << " required_signatures: " << int(message.header.num_required_signatures);
    out << " readonly_signed: " << int(message.header.num_readonly_signed_accounts);
    out << " readonly_unsigned: " << int(message.header.num_readonly_unsigned_accounts);
    out << " #account_keys: " << message.account_keys.size();
    out << " #instructions: " << message.instructions.size();
    out << " #address_table_lookups: " << message.address_table_lookups.size();
    return out;
}

VersionedTransaction decode_transaction(ByteView data) {
    decoding::BorshReader reader{data};
    VersionedTransaction transaction;
    const auto signature_count = reader.read_shortvec_length();
    transaction.signatures.reserve(signature_count);
    for (std::size_t i{0}; i < signature_count; ++i) {
        Signature signature;
        const auto bytes = reader.read_bytes(kSignatureLength);
        std::copy(bytes.begin(), bytes.end(), signature.bytes.begin());
        transaction.signatures.push_back(signature);
    }
    transaction.message = read_message(reader);
    reader.expect_end("transaction");
    return transaction;
}

Bytes encode_message(const Message& message) {
    decoding::BorshWriter writer;
    if (message.version) {
        writer.write_u8(kVersionPrefixMask | *message.version);
    }
    writer.write_u8(message.header.num_required_signatures);
    writer.write_u8(message.header.num_readonly_signed_accounts);
    writer.write_u8(message.header.num_readonly_unsigned_accounts);

    writer.write_shortvec_length(static_cast<uint16_t>(message.account_keys.size()));
    for (const auto& key : message.account_keys) {
        writer.write_bytes(key.view());
    }
    writer.write_bytes({message.recent_blockhash.data(), message.recent_blockhash.size()});

    writer.write_shortvec_length(static_cast<uint16_t>(message.instructions.size()));
    for (const auto& instruction : message.instructions) {
        writer.write_u8(instruction.program_id_index);
        write_index_list(writer, instruction.accounts);
        writer.write_shortvec_length(static_cast<uint16_t>(instruction.data.size()));
        writer.write_bytes(instruction.data);
    }

    if (message.version) {
        writer.write_shortvec_length(static_cast<uint16_t>(message.address_table_lookups.size()));
        for (const auto& lookup : message.address_table_lookups) {
            writer.write_bytes(lookup.account_key.view());
            write_index_list(writer, lookup.writable_indexes);
            write_index_list(writer, lookup.readonly_indexes);
        }
    }
    return writer.release();
}

Bytes encode_transaction(const VersionedTransaction& transaction) {
    decoding::BorshWriter writer;
    writer.write_shortvec_length(static_cast<uint16_t>(transaction.signatures.size()));
    for (const auto& signature : transaction.signatures) {
        writer.write_bytes(signature.view());
    }
    writer.write_bytes(encode_message(transaction.message));
    return writer.release();
}

} // namespace driftgate
