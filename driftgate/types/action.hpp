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

#ifndef DRIFTGATE_TYPES_ACTION_HPP_
#define DRIFTGATE_TYPES_ACTION_HPP_

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <driftgate/decoding/instruction.hpp>

namespace driftgate {

struct AccountDump {
    std::size_t position{0};
    /* index into the combined key table, rendered as accountIndex */
    std::size_t message_index{0};
    std::string pubkey;
    bool is_signer{false};
    bool is_writable{false};
    std::optional<std::string> role;
};

struct InstructionDump {
    std::size_t index{0};
    std::string discriminator;
    std::string raw_data_b64;
    std::size_t data_len{0};
    std::string program_id;
    /* empty when the payload is not one of the supported instructions or failed to decode */
    std::optional<decoding::DecodedInstruction> decoded;
    std::vector<AccountDump> accounts;
};

struct SignatureDump {
    std::string signature;
    uint64_t slot{0};
    std::optional<int64_t> block_time;
    std::vector<InstructionDump> instructions;
};

struct ActionRecord {
    std::string signature;
    uint64_t slot{0};
    std::optional<int64_t> block_time;
    std::size_t instruction_index{0};
    std::string action_type;
    std::optional<uint16_t> market_index;
    std::optional<uint16_t> perp_market_index;
    std::optional<uint16_t> spot_market_index;
    std::optional<std::string> direction;
    std::optional<uint64_t> base_asset_amount;
    std::optional<uint64_t> price;
    std::optional<bool> reduce_only;
    std::optional<double> leverage;
    std::optional<uint64_t> amount;
    std::optional<std::string> token_account;
    std::optional<std::string> token_mint;
    std::optional<uint64_t> token_amount;
};

bool operator==(const ActionRecord& lhs, const ActionRecord& rhs);

std::ostream& operator<<(std::ostream& out, const ActionRecord& record);

} // namespace driftgate

#endif // DRIFTGATE_TYPES_ACTION_HPP_
