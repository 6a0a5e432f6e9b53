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

#ifndef DRIFTGATE_DECODING_INSTRUCTION_HPP_
#define DRIFTGATE_DECODING_INSTRUCTION_HPP_

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <driftgate/common/base.hpp>
#include <driftgate/decoding/error.hpp>

namespace driftgate::decoding {

using Discriminator = std::array<uint8_t, kDiscriminatorLength>;

//! First 8 bytes of sha256("global:<name>"), the Anchor instruction selector.
Discriminator anchor_discriminator(std::string_view snake_case_name);

enum class InstructionKind {
    kDepositIntoIsolatedPerpPosition,
    kWithdrawFromIsolatedPerpPosition,
    kPlacePerpOrder,
};

//! camelCase label, e.g. "placePerpOrder"
std::string_view kind_label(InstructionKind kind);
std::optional<InstructionKind> kind_from_label(std::string_view label);

//! Positional account names of the instruction, in on-chain declaration order.
const std::vector<std::string_view>& account_names(InstructionKind kind);

// The variant lists below mirror the on-chain declaration order: the wire discriminant is the index.

enum class OrderType : uint8_t { kMarket, kLimit, kTriggerMarket, kTriggerLimit, kOracle };
constexpr std::size_t kOrderTypeCount{5};

enum class MarketType : uint8_t { kSpot, kPerp };
constexpr std::size_t kMarketTypeCount{2};

enum class PositionDirection : uint8_t { kLong, kShort };
constexpr std::size_t kPositionDirectionCount{2};

enum class PostOnlyParam : uint8_t { kNone, kMustPostOnly, kTryPostOnly, kSlide };
constexpr std::size_t kPostOnlyParamCount{4};

enum class OrderTriggerCondition : uint8_t { kAbove, kBelow, kTriggeredAbove, kTriggeredBelow };
constexpr std::size_t kOrderTriggerConditionCount{4};

std::string_view to_string(OrderType value);
std::string_view to_string(MarketType value);
std::string_view to_string(PositionDirection value);
std::string_view to_string(PostOnlyParam value);
std::string_view to_string(OrderTriggerCondition value);

constexpr uint8_t kImmediateOrCancelFlag{0b01};
constexpr uint8_t kUpdateHighLeverageModeFlag{0b10};

std::vector<std::string_view> bit_flag_labels(uint8_t bit_flags);

//! Arguments shared by deposit_into_isolated_perp_position and withdraw_from_isolated_perp_position.
struct IsolatedPerpMovementArgs {
    uint16_t spot_market_index{0};
    uint16_t perp_market_index{0};
    uint64_t amount{0};
};

bool operator==(const IsolatedPerpMovementArgs& lhs, const IsolatedPerpMovementArgs& rhs);

struct OrderParams {
    OrderType order_type{OrderType::kMarket};
    MarketType market_type{MarketType::kPerp};
    PositionDirection direction{PositionDirection::kLong};
    uint8_t user_order_id{0};
    uint64_t base_asset_amount{0};
    uint64_t price{0};
    uint16_t market_index{0};
    bool reduce_only{false};
    PostOnlyParam post_only{PostOnlyParam::kNone};
    uint8_t bit_flags{0};
    std::optional<int64_t> max_ts;
    std::optional<uint64_t> trigger_price;
    OrderTriggerCondition trigger_condition{OrderTriggerCondition::kAbove};
    std::optional<int32_t> oracle_price_offset;
    std::optional<uint8_t> auction_duration;
    std::optional<int64_t> auction_start_price;
    std::optional<int64_t> auction_end_price;
};

bool operator==(const OrderParams& lhs, const OrderParams& rhs);

using InstructionArgs = std::variant<IsolatedPerpMovementArgs, OrderParams>;

struct DecodedInstruction {
    InstructionKind kind;
    InstructionArgs args;
};

bool operator==(const DecodedInstruction& lhs, const DecodedInstruction& rhs);

std::ostream& operator<<(std::ostream& out, const DecodedInstruction& instruction);

//! Decode Anchor instruction data of the supported Drift instructions.
//! Returns empty if the discriminator is not one of ours, throws DecodeError on any malformed payload.
std::optional<DecodedInstruction> decode_instruction(ByteView data);

//! Exact inverse of decode_instruction: discriminator followed by the Borsh-encoded arguments.
Bytes encode_instruction(const DecodedInstruction& instruction);

} // namespace driftgate::decoding

#endif // DRIFTGATE_DECODING_INSTRUCTION_HPP_
