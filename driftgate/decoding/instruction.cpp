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

#include "instruction.hpp"

#include <algorithm>
#include <stdexcept>

#include <driftgate/common/util.hpp>
#include <driftgate/crypto/hash.hpp>
#include <driftgate/decoding/borsh.hpp>

namespace driftgate::decoding {

namespace {

struct KnownInstruction {
    InstructionKind kind;
    Discriminator discriminator;
};

const std::array<KnownInstruction, 3>& known_instructions() {
    static const std::array<KnownInstruction, 3> kKnownInstructions{{
        {InstructionKind::kDepositIntoIsolatedPerpPosition, anchor_discriminator("deposit_into_isolated_perp_position")},
        {InstructionKind::kWithdrawFromIsolatedPerpPosition, anchor_discriminator("withdraw_from_isolated_perp_position")},
        {InstructionKind::kPlacePerpOrder, anchor_discriminator("place_perp_order")},
    }};
    return kKnownInstructions;
}

const Discriminator& discriminator_of(InstructionKind kind) {
    for (const auto& known : known_instructions()) {
        if (known.kind == kind) {
            return known.discriminator;
        }
    }
    throw std::invalid_argument{"unknown instruction kind"};
}

IsolatedPerpMovementArgs read_movement_args(BorshReader& reader) {
    IsolatedPerpMovementArgs args;
    args.spot_market_index = reader.read_u16();
    args.perp_market_index = reader.read_u16();
    args.amount = reader.read_u64();
    return args;
}

OrderParams read_order_params(BorshReader& reader) {
    OrderParams params;
    params.order_type = reader.read_enum<OrderType>(kOrderTypeCount, "OrderType");
    params.market_type = reader.read_enum<MarketType>(kMarketTypeCount, "MarketType");
    params.direction = reader.read_enum<PositionDirection>(kPositionDirectionCount, "PositionDirection");
    params.user_order_id = reader.read_u8();
    params.base_asset_amount = reader.read_u64();
    params.price = reader.read_u64();
    params.market_index = reader.read_u16();
    params.reduce_only = reader.read_bool();
    params.post_only = reader.read_enum<PostOnlyParam>(kPostOnlyParamCount, "PostOnlyParam");
    params.bit_flags = reader.read_u8();
    params.max_ts = reader.read_option<int64_t>([&]() { return reader.read_i64(); });
    params.trigger_price = reader.read_option<uint64_t>([&]() { return reader.read_u64(); });
    params.trigger_condition = reader.read_enum<OrderTriggerCondition>(kOrderTriggerConditionCount, "OrderTriggerCondition");
    params.oracle_price_offset = reader.read_option<int32_t>([&]() { return reader.read_i32(); });
    params.auction_duration = reader.read_option<uint8_t>([&]() { return reader.read_u8(); });
    params.auction_start_price = reader.read_option<int64_t>([&]() { return reader.read_i64(); });
    params.auction_end_price = reader.read_option<int64_t>([&]() { return reader.read_i64(); });
    return params;
}

void write_movement_args(BorshWriter& writer, const IsolatedPerpMovementArgs& args) {
    writer.write_u16(args.spot_market_index);
    writer.write_u16(args.perp_market_index);
    writer.write_u64(args.amount);
}

void write_order_params(BorshWriter& writer, const OrderParams& params) {
    writer.write_enum(params.order_type);
    writer.write_enum(params.market_type);
    writer.write_enum(params.direction);
    writer.write_u8(params.user_order_id);
    writer.write_u64(params.base_asset_amount);
    writer.write_u64(params.price);
    writer.write_u16(params.market_index);
    writer.write_bool(params.reduce_only);
    writer.write_enum(params.post_only);
    writer.write_u8(params.bit_flags);
    writer.write_option(params.max_ts, [&](int64_t v) { writer.write_i64(v); });
    writer.write_option(params.trigger_price, [&](uint64_t v) { writer.write_u64(v); });
    writer.write_enum(params.trigger_condition);
    writer.write_option(params.oracle_price_offset, [&](int32_t v) { writer.write_i32(v); });
    writer.write_option(params.auction_duration, [&](uint8_t v) { writer.write_u8(v); });
    writer.write_option(params.auction_start_price, [&](int64_t v) { writer.write_i64(v); });
    writer.write_option(params.auction_end_price, [&](int64_t v) { writer.write_i64(v); });
}

} // namespace

Discriminator anchor_discriminator(std::string_view snake_case_name) {
    const std::string preimage = "global:" + std::string{snake_case_name};
    const auto digest = crypto::sha256(byte_view_of_string(preimage));
    Discriminator discriminator;
    std::copy_n(digest.begin(), discriminator.size(), discriminator.begin());
    return discriminator;
}

std::string_view kind_label(InstructionKind kind) {
    switch (kind) {
        case InstructionKind::kDepositIntoIsolatedPerpPosition: return "depositIntoIsolatedPerpPosition";
        case InstructionKind::kWithdrawFromIsolatedPerpPosition: return "withdrawFromIsolatedPerpPosition";
        case InstructionKind::kPlacePerpOrder: return "placePerpOrder";
    }
    return "unknown";
}

std::optional<InstructionKind> kind_from_label(std::string_view label) {
    for (const auto& known : known_instructions()) {
        if (kind_label(known.kind) == label) {
            return known.kind;
        }
    }
    return std::nullopt;
}

const std::vector<std::string_view>& account_names(InstructionKind kind) {
    static const std::vector<std::string_view> kDepositAccounts{
        "state", "user", "userStats", "authority", "spotMarketVault", "userTokenAccount", "tokenProgram"};
    static const std::vector<std::string_view> kWithdrawAccounts{
        "state", "user", "userStats", "authority", "spotMarketVault", "driftSigner", "userTokenAccount", "tokenProgram"};
    static const std::vector<std::string_view> kPlacePerpOrderAccounts{"state", "user", "authority"};

    switch (kind) {
        case InstructionKind::kDepositIntoIsolatedPerpPosition: return kDepositAccounts;
        case InstructionKind::kWithdrawFromIsolatedPerpPosition: return kWithdrawAccounts;
        case InstructionKind::kPlacePerpOrder: return kPlacePerpOrderAccounts;
    }
    throw std::invalid_argument{"unknown instruction kind"};
}

std::string_view to_string(OrderType value) {
    switch (value) {
        case OrderType::kMarket: return "Market";
        case OrderType::kLimit: return "Limit";
        case OrderType::kTriggerMarket: return "TriggerMarket";
        case OrderType::kTriggerLimit: return "TriggerLimit";
        case OrderType::kOracle: return "Oracle";
    }
    return "Unknown";
}

std::string_view to_string(MarketType value) {
    switch (value) {
        case MarketType::kSpot: return "Spot";
        case MarketType::kPerp: return "Perp";
    }
    return "Unknown";
}

std::string_view to_string(PositionDirection value) {
    switch (value) {
        case PositionDirection::kLong: return "Long";
        case PositionDirection::kShort: return "Short";
    }
    return "Unknown";
}

std::string_view to_string(PostOnlyParam value) {
    switch (value) {
        case PostOnlyParam::kNone: return "None";
        case PostOnlyParam::kMustPostOnly: return "MustPostOnly";
        case PostOnlyParam::kTryPostOnly: return "TryPostOnly";
        case PostOnlyParam::kSlide: return "Slide";
    }
    return "Unknown";
}

std::string_view to_string(OrderTriggerCondition value) {
    switch (value) {
        case OrderTriggerCondition::kAbove: return "Above";
        case OrderTriggerCondition::kBelow: return "Below";
        case OrderTriggerCondition::kTriggeredAbove: return "TriggeredAbove";
        case OrderTriggerCondition::kTriggeredBelow: return "TriggeredBelow";
    }
    return "Unknown";
}

std::vector<std::string_view> bit_flag_labels(uint8_t bit_flags) {
    std::vector<std::string_view> labels;
    if (bit_flags & kImmediateOrCancelFlag) {
        labels.emplace_back("ImmediateOrCancel");
    }
    if (bit_flags & kUpdateHighLeverageModeFlag) {
        labels.emplace_back("UpdateHighLeverageMode");
    }
    return labels;
}

bool operator==(const IsolatedPerpMovementArgs& lhs, const IsolatedPerpMovementArgs& rhs) {
    return lhs.spot_market_index == rhs.spot_market_index && lhs.perp_market_index == rhs.perp_market_index &&
        lhs.amount == rhs.amount;
}

bool operator==(const OrderParams& lhs, const OrderParams& rhs) {
    return lhs.order_type == rhs.order_type && lhs.market_type == rhs.market_type && lhs.direction == rhs.direction &&
        lhs.user_order_id == rhs.user_order_id && lhs.base_asset_amount == rhs.base_asset_amount &&
        lhs.price == rhs.price && lhs.market_index == rhs.market_index && lhs.reduce_only == rhs.reduce_only &&
        lhs.post_only == rhs.post_only && lhs.bit_flags == rhs.bit_flags && lhs.max_ts == rhs.max_ts &&
        lhs.trigger_price == rhs.trigger_price && lhs.trigger_condition == rhs.trigger_condition &&
        lhs.oracle_price_offset == rhs.oracle_price_offset && lhs.auction_duration == rhs.auction_duration &&
        lhs.auction_start_price == rhs.auction_start_price && lhs.auction_end_price == rhs.auction_end_price;
}

bool operator==(const DecodedInstruction& lhs, const DecodedInstruction& rhs) {
    return lhs.kind == rhs.kind && lhs.args == rhs.args;
}

std::ostream& operator<<(std::ostream& out, const DecodedInstruction& instruction) {
    out << kind_label(instruction.kind);
    if (const auto* movement = std::get_if<IsolatedPerpMovementArgs>(&instruction.args)) {
        out << " spot_market_index=" << movement->spot_market_index << " perp_market_index="
            << movement->perp_market_index << " amount=" << movement->amount;
    } else if (const auto* order = std::get_if<OrderParams>(&instruction.args)) {
        out << " " << to_string(order->order_type) << " " << to_string(order->direction)
            << " market_index=" << order->market_index << " base_asset_amount=" << order->base_asset_amount
            << " price=" << order->price << " reduce_only=" << order->reduce_only;
    }
    return out;
}

std::optional<DecodedInstruction> decode_instruction(ByteView data) {
    if (data.size() < kDiscriminatorLength) {
        throw DecodeError{"instruction shorter than anchor discriminator: " + std::to_string(data.size()) + " bytes"};
    }
    const auto prefix = data.substr(0, kDiscriminatorLength);

    const auto& known = known_instructions();
    const auto it = std::find_if(known.begin(), known.end(), [&](const auto& k) {
        return std::equal(k.discriminator.begin(), k.discriminator.end(), prefix.begin());
    });
    if (it == known.end()) {
        return std::nullopt;
    }

    BorshReader reader{data.substr(kDiscriminatorLength)};
    DecodedInstruction decoded{it->kind, {}};
    if (it->kind == InstructionKind::kPlacePerpOrder) {
        decoded.args = read_order_params(reader);
    } else {
        decoded.args = read_movement_args(reader);
    }
    reader.expect_end(kind_label(it->kind).data());
    return decoded;
}

Bytes encode_instruction(const DecodedInstruction& instruction) {
    const bool expects_order = instruction.kind == InstructionKind::kPlacePerpOrder;
    if (expects_order != std::holds_alternative<OrderParams>(instruction.args)) {
        throw std::invalid_argument{"arguments do not match instruction " + std::string{kind_label(instruction.kind)}};
    }

    const auto& discriminator = discriminator_of(instruction.kind);
    BorshWriter writer;
    writer.write_bytes({discriminator.data(), discriminator.size()});
    if (expects_order) {
        write_order_params(writer, std::get<OrderParams>(instruction.args));
    } else {
        write_movement_args(writer, std::get<IsolatedPerpMovementArgs>(instruction.args));
    }
    return writer.release();
}

} // namespace driftgate::decoding
