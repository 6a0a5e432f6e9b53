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

#ifndef DRIFTGATE_JSON_TYPES_HPP_
#define DRIFTGATE_JSON_TYPES_HPP_

#include <nlohmann/json.hpp>

#include <driftgate/decoding/instruction.hpp>
#include <driftgate/types/action.hpp>
#include <driftgate/types/fetched_transaction.hpp>
#include <driftgate/types/pubkey.hpp>

namespace driftgate::decoding {

void to_json(nlohmann::json& json, const IsolatedPerpMovementArgs& args);

void to_json(nlohmann::json& json, const OrderParams& params);

//! Arguments only, rendered with camelCase keys and null for absent optionals
void to_json(nlohmann::json& json, const InstructionArgs& args);

} // namespace driftgate::decoding

namespace driftgate {

void to_json(nlohmann::json& json, const PublicKey& key);
void from_json(const nlohmann::json& json, PublicKey& key);

void to_json(nlohmann::json& json, const Signature& signature);

void to_json(nlohmann::json& json, const AccountDump& account);

void to_json(nlohmann::json& json, const InstructionDump& instruction);

void to_json(nlohmann::json& json, const SignatureDump& dump);

void to_json(nlohmann::json& json, const ActionRecord& record);
void from_json(const nlohmann::json& json, ActionRecord& record);

void from_json(const nlohmann::json& json, TokenBalance& balance);

void from_json(const nlohmann::json& json, TransactionMeta& meta);

//! From the result object of getTransaction requested with base64 encoding
void from_json(const nlohmann::json& json, FetchedTransaction& transaction);

} // namespace driftgate

#endif // DRIFTGATE_JSON_TYPES_HPP_
