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

#include "action.hpp"

namespace driftgate {

bool operator==(const ActionRecord& lhs, const ActionRecord& rhs) {
    return lhs.signature == rhs.signature && lhs.slot == rhs.slot && lhs.block_time == rhs.block_time &&
        lhs.instruction_index == rhs.instruction_index && lhs.action_type == rhs.action_type &&
        lhs.market_index == rhs.market_index && lhs.perp_market_index == rhs.perp_market_index &&
        lhs.spot_market_index == rhs.spot_market_index && lhs.direction == rhs.direction &&
        lhs.base_asset_amount == rhs.base_asset_amount && lhs.price == rhs.price &&
        lhs.reduce_only == rhs.reduce_only && lhs.leverage == rhs.leverage && lhs.amount == rhs.amount &&
        lhs.token_account == rhs.token_account && lhs.token_mint == rhs.token_mint &&
        lhs.token_amount == rhs.token_amount;
}

std::ostream& operator<<(std::ostream& out, const ActionRecord& record) {
    out << "signature: " << record.signature;
    out << " instruction_index: " << record.instruction_index;
    out << " slot: " << record.slot;
    out << " action_type: " << record.action_type;
    if (record.market_index) {
        out << " market_index: " << *record.market_index;
    }
    if (record.direction) {
        out << " direction: " << *record.direction;
    }
    if (record.base_asset_amount) {
        out << " base_asset_amount: " << *record.base_asset_amount;
    }
    if (record.amount) {
        out << " amount: " << *record.amount;
    }
    if (record.token_mint) {
        out << " token_mint: " << *record.token_mint;
    }
    return out;
}

} // namespace driftgate
