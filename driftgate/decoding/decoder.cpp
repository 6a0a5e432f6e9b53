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

#include "decoder.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <utility>

#include <driftgate/common/constants.hpp>
#include <driftgate/common/log.hpp>
#include <driftgate/common/util.hpp>
#include <driftgate/decoding/error.hpp>
#include <driftgate/decoding/instruction.hpp>
#include <driftgate/types/transaction.hpp>

namespace driftgate::decoding {

namespace {

using TokenMintLookup = std::map<std::size_t, std::string>;

constexpr const char* kUserTokenAccountRole{"userTokenAccount"};

TokenMintLookup build_token_mint_lookup(const TransactionMeta& meta) {
    TokenMintLookup lookup;
    for (const auto* balances : {&meta.pre_token_balances, &meta.post_token_balances}) {
        for (const auto& balance : *balances) {
            lookup.emplace(balance.account_index, balance.mint);
        }
    }
    return lookup;
}

std::vector<PublicKey> collect_account_keys(const Message& message, const TransactionMeta& meta) {
    std::vector<PublicKey> keys{message.account_keys};
    keys.reserve(keys.size() + meta.loaded_writable.size() + meta.loaded_readonly.size());
    for (const auto* loaded : {&meta.loaded_writable, &meta.loaded_readonly}) {
        for (const auto& encoded : *loaded) {
            const auto key = PublicKey::from_base58(encoded);
            if (!key) {
                throw DecodeError{"invalid loaded address " + encoded};
            }
            keys.push_back(*key);
        }
    }
    return keys;
}

std::vector<AccountDump> collect_account_dump(const Message& message, const CompiledInstruction& instruction,
                                              const std::vector<PublicKey>& account_keys, std::size_t loaded_writable_count,
                                              const std::optional<DecodedInstruction>& decoded) {
    std::vector<AccountDump> accounts;
    accounts.reserve(instruction.accounts.size());
    for (std::size_t position{0}; position < instruction.accounts.size(); ++position) {
        const std::size_t global_index = instruction.accounts[position];
        if (global_index >= account_keys.size()) {
            throw DecodeError{"account index out of bounds: " + std::to_string(global_index)};
        }
        AccountDump account;
        account.position = position;
        account.message_index = global_index;
        account.pubkey = account_keys[global_index].to_base58();
        account.is_signer = message.is_signer(global_index);
        account.is_writable = message.is_writable(global_index, loaded_writable_count);
        if (decoded) {
            const auto& roles = account_names(decoded->kind);
            if (position < roles.size()) {
                account.role = std::string{roles[position]};
            }
        }
        accounts.push_back(std::move(account));
    }
    return accounts;
}

ActionRecord build_action_record(const std::string& signature, const FetchedTransaction& fetched, std::size_t instruction_index,
                                 const DecodedInstruction& decoded, const std::vector<AccountDump>& accounts,
                                 const TokenMintLookup& token_lookup) {
    ActionRecord record;
    record.signature = signature;
    record.slot = fetched.slot;
    record.block_time = fetched.block_time;
    record.instruction_index = instruction_index;
    record.action_type = std::string{kind_label(decoded.kind)};

    if (const auto* movement = std::get_if<IsolatedPerpMovementArgs>(&decoded.args)) {
        record.market_index = movement->perp_market_index;
        record.perp_market_index = movement->perp_market_index;
        record.spot_market_index = movement->spot_market_index;
        record.amount = movement->amount;
        record.token_amount = movement->amount;

        const auto token_account = std::find_if(accounts.begin(), accounts.end(), [](const auto& account) {
            return account.role == kUserTokenAccountRole;
        });
        if (token_account != accounts.end()) {
            record.token_account = token_account->pubkey;
            const auto mint = token_lookup.find(token_account->message_index);
            if (mint != token_lookup.end()) {
                record.token_mint = mint->second;
            }
        }
    } else {
        const auto& order = std::get<OrderParams>(decoded.args);
        record.market_index = order.market_index;
        if (order.market_type == MarketType::kPerp) {
            record.perp_market_index = order.market_index;
        } else {
            record.spot_market_index = order.market_index;
        }
        record.direction = std::string{to_string(order.direction)};
        record.base_asset_amount = order.base_asset_amount;
        record.price = order.price;
        record.reduce_only = order.reduce_only;
    }
    return record;
}

} // namespace

PublicKey default_program_id() {
    return *PublicKey::from_base58(kDefaultDriftProgram);
}

Decoder::Decoder(rpc::TransactionSource& source, DecoderSettings settings)
    : source_{source}, settings_{std::move(settings)} {}

boost::asio::awaitable<DecodeResult> Decoder::decode_signature(std::string signature) const {
    if (!Signature::from_base58(signature)) {
        throw DecodeError{"invalid signature " + signature};
    }
    DRIFTGATE_DEBUG << "Decoder::decode_signature fetching " << signature << "\n";
    const auto fetched = co_await source_.get_transaction(signature, kCommitmentConfirmed);
    co_return decode_fetched(signature, fetched);
}

DecodeResult Decoder::decode_fetched(const std::string& signature, const FetchedTransaction& fetched) const {
    if (!fetched.meta) {
        throw DecodeError{"transaction missing meta: " + signature};
    }
    const auto& meta = *fetched.meta;
    const auto token_lookup = build_token_mint_lookup(meta);

    const auto transaction = decode_transaction(fetched.transaction);
    const auto& message = transaction.message;
    const auto account_keys = collect_account_keys(message, meta);

    DecodeResult result;
    result.dump.signature = signature;
    result.dump.slot = fetched.slot;
    result.dump.block_time = fetched.block_time;

    for (std::size_t index{0}; index < message.instructions.size(); ++index) {
        const auto& instruction = message.instructions[index];
        if (instruction.program_id_index >= account_keys.size()) {
            throw DecodeError{"program index out of bounds: " + std::to_string(instruction.program_id_index)};
        }
        const auto& program_id = account_keys[instruction.program_id_index];
        if (program_id != settings_.program_id) {
            continue;
        }

        std::optional<DecodedInstruction> decoded;
        try {
            decoded = decode_instruction(instruction.data);
        } catch (const DecodeError& e) {
            DRIFTGATE_ERROR << "decode error signature: " << signature << " ix: " << index << " " << e.what() << "\n";
        }

        auto accounts = collect_account_dump(message, instruction, account_keys, meta.loaded_writable.size(), decoded);
        if (decoded) {
            result.actions.push_back(build_action_record(signature, fetched, index, *decoded, accounts, token_lookup));
        }

        InstructionDump dump;
        dump.index = index;
        dump.discriminator = to_colon_hex(ByteView{instruction.data}.substr(0, kDiscriminatorLength));
        dump.raw_data_b64 = base64_encode(instruction.data);
        dump.data_len = instruction.data.size();
        dump.program_id = program_id.to_base58();
        dump.decoded = std::move(decoded);
        dump.accounts = std::move(accounts);
        result.dump.instructions.push_back(std::move(dump));
    }

    if (result.dump.instructions.empty()) {
        DRIFTGATE_WARN << "no drift instructions signature: " << signature << "\n";
    }
    DRIFTGATE_DEBUG << "Decoder::decode_fetched signature: " << signature << " #instructions: "
                    << result.dump.instructions.size() << " #actions: " << result.actions.size() << "\n";
    return result;
}

} // namespace driftgate::decoding
