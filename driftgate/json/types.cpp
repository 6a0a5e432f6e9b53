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

#include "types.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <driftgate/common/util.hpp>

namespace driftgate {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

template <typename T>
std::optional<T> optional_from_json(const nlohmann::json& json, const char* key) {
    const auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

std::vector<TokenBalance> token_balances_from_json(const nlohmann::json& json, const char* key) {
    const auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return {};
    }
    return it->get<std::vector<TokenBalance>>();
}

} // namespace

void to_json(nlohmann::json& json, const PublicKey& key) {
    json = key.to_base58();
}

void from_json(const nlohmann::json& json, PublicKey& key) {
    const auto encoded = json.get<std::string>();
    const auto decoded = PublicKey::from_base58(encoded);
    if (!decoded) {
        throw std::invalid_argument{"invalid public key " + encoded};
    }
    key = *decoded;
}

void to_json(nlohmann::json& json, const Signature& signature) {
    json = signature.to_base58();
}

void to_json(nlohmann::json& json, const AccountDump& account) {
    json["position"] = account.position;
    json["accountIndex"] = account.message_index;
    json["pubkey"] = account.pubkey;
    json["is_signer"] = account.is_signer;
    json["is_writable"] = account.is_writable;
    json["role"] = optional_to_json(account.role);
}

void to_json(nlohmann::json& json, const InstructionDump& instruction) {
    json["index"] = instruction.index;
    json["discriminator"] = instruction.discriminator;
    json["raw_data_b64"] = instruction.raw_data_b64;
    json["data_len"] = instruction.data_len;
    json["program_id"] = instruction.program_id;
    if (instruction.decoded) {
        json["kind"] = std::string{decoding::kind_label(instruction.decoded->kind)};
        json["args"] = instruction.decoded->args;
    } else {
        json["kind"] = nullptr;
        json["args"] = nullptr;
    }
    json["accounts"] = instruction.accounts;
}

void to_json(nlohmann::json& json, const SignatureDump& dump) {
    json["signature"] = dump.signature;
    json["slot"] = dump.slot;
    json["block_time"] = optional_to_json(dump.block_time);
    json["instructions"] = dump.instructions;
}

void to_json(nlohmann::json& json, const ActionRecord& record) {
    json["signature"] = record.signature;
    json["slot"] = record.slot;
    json["block_time"] = optional_to_json(record.block_time);
    json["instruction_index"] = record.instruction_index;
    json["action_type"] = record.action_type;
    json["market_index"] = optional_to_json(record.market_index);
    json["perp_market_index"] = optional_to_json(record.perp_market_index);
    json["spot_market_index"] = optional_to_json(record.spot_market_index);
    json["direction"] = optional_to_json(record.direction);
    json["base_asset_amount"] = optional_to_json(record.base_asset_amount);
    json["price"] = optional_to_json(record.price);
    json["reduce_only"] = optional_to_json(record.reduce_only);
    json["leverage"] = optional_to_json(record.leverage);
    json["amount"] = optional_to_json(record.amount);
    json["token_account"] = optional_to_json(record.token_account);
    json["token_mint"] = optional_to_json(record.token_mint);
    json["token_amount"] = optional_to_json(record.token_amount);
}

void from_json(const nlohmann::json& json, ActionRecord& record) {
    record.signature = json.at("signature").get<std::string>();
    record.slot = json.at("slot").get<uint64_t>();
    record.block_time = optional_from_json<int64_t>(json, "block_time");
    record.instruction_index = json.at("instruction_index").get<std::size_t>();
    record.action_type = json.at("action_type").get<std::string>();
    record.market_index = optional_from_json<uint16_t>(json, "market_index");
    record.perp_market_index = optional_from_json<uint16_t>(json, "perp_market_index");
    record.spot_market_index = optional_from_json<uint16_t>(json, "spot_market_index");
    record.direction = optional_from_json<std::string>(json, "direction");
    record.base_asset_amount = optional_from_json<uint64_t>(json, "base_asset_amount");
    record.price = optional_from_json<uint64_t>(json, "price");
    record.reduce_only = optional_from_json<bool>(json, "reduce_only");
    record.leverage = optional_from_json<double>(json, "leverage");
    record.amount = optional_from_json<uint64_t>(json, "amount");
    record.token_account = optional_from_json<std::string>(json, "token_account");
    record.token_mint = optional_from_json<std::string>(json, "token_mint");
    record.token_amount = optional_from_json<uint64_t>(json, "token_amount");
}

void from_json(const nlohmann::json& json, TokenBalance& balance) {
    balance.account_index = json.at("accountIndex").get<std::size_t>();
    balance.mint = json.at("mint").get<std::string>();
}

void from_json(const nlohmann::json& json, TransactionMeta& meta) {
    const auto err = json.find("err");
    if (err != json.end() && !err->is_null()) {
        meta.err = err->dump();
    }
    meta.pre_token_balances = token_balances_from_json(json, "preTokenBalances");
    meta.post_token_balances = token_balances_from_json(json, "postTokenBalances");
    const auto loaded = json.find("loadedAddresses");
    if (loaded != json.end() && !loaded->is_null()) {
        meta.loaded_writable = loaded->value("writable", std::vector<std::string>{});
        meta.loaded_readonly = loaded->value("readonly", std::vector<std::string>{});
    }
}

void from_json(const nlohmann::json& json, FetchedTransaction& transaction) {
    transaction.slot = json.at("slot").get<uint64_t>();
    transaction.block_time = optional_from_json<int64_t>(json, "blockTime");

    // ["<payload>", "base64"]
    const auto& encoded = json.at("transaction");
    if (!encoded.is_array() || encoded.size() != 2 || encoded[1] != "base64") {
        throw std::invalid_argument{"transaction payload is not base64 encoded"};
    }
    const auto payload = base64_decode(encoded[0].get<std::string>());
    if (!payload) {
        throw std::invalid_argument{"transaction payload is not valid base64"};
    }
    transaction.transaction = *payload;
    transaction.meta = optional_from_json<TransactionMeta>(json, "meta");
}

} // namespace driftgate

namespace driftgate::decoding {

void to_json(nlohmann::json& json, const IsolatedPerpMovementArgs& args) {
    json["spotMarketIndex"] = args.spot_market_index;
    json["perpMarketIndex"] = args.perp_market_index;
    json["amount"] = args.amount;
}

void to_json(nlohmann::json& json, const OrderParams& params) {
    json["orderType"] = std::string{to_string(params.order_type)};
    json["marketType"] = std::string{to_string(params.market_type)};
    json["direction"] = std::string{to_string(params.direction)};
    json["userOrderId"] = params.user_order_id;
    json["baseAssetAmount"] = params.base_asset_amount;
    json["price"] = params.price;
    json["marketIndex"] = params.market_index;
    json["reduceOnly"] = params.reduce_only;
    json["postOnly"] = std::string{to_string(params.post_only)};
    json["bitFlags"]["raw"] = params.bit_flags;
    std::vector<std::string> labels;
    for (const auto label : bit_flag_labels(params.bit_flags)) {
        labels.emplace_back(label);
    }
    json["bitFlags"]["labels"] = labels;
    json["maxTs"] = optional_to_json(params.max_ts);
    json["triggerPrice"] = optional_to_json(params.trigger_price);
    json["triggerCondition"] = std::string{to_string(params.trigger_condition)};
    json["oraclePriceOffset"] = optional_to_json(params.oracle_price_offset);
    json["auctionDuration"] = optional_to_json(params.auction_duration);
    json["auctionStartPrice"] = optional_to_json(params.auction_start_price);
    json["auctionEndPrice"] = optional_to_json(params.auction_end_price);
}

void to_json(nlohmann::json& json, const InstructionArgs& args) {
    std::visit([&](const auto& alternative) { to_json(json, alternative); }, args);
}

} // namespace driftgate::decoding
