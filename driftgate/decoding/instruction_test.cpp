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

#include <sstream>

#include <catch2/catch.hpp>

#include <driftgate/common/util.hpp>

namespace driftgate::decoding {

using Catch::Matchers::Contains;

static OrderParams sample_order_params() {
    OrderParams params;
    params.order_type = OrderType::kLimit;
    params.market_type = MarketType::kPerp;
    params.direction = PositionDirection::kShort;
    params.user_order_id = 7;
    params.base_asset_amount = 1'000'000'000;
    params.price = 150'000'000;
    params.market_index = 2;
    params.reduce_only = true;
    params.post_only = PostOnlyParam::kMustPostOnly;
    params.bit_flags = kImmediateOrCancelFlag;
    params.max_ts = 1'700'000'000;
    params.oracle_price_offset = -5'000;
    params.auction_duration = 10;
    return params;
}

TEST_CASE("anchor discriminators", "[driftgate][decoding][instruction]") {
    auto hex_of = [](const Discriminator& d) { return to_hex({d.data(), d.size()}); };
    CHECK(hex_of(anchor_discriminator("deposit_into_isolated_perp_position")) == "6530ff997f79aa1a");
    CHECK(hex_of(anchor_discriminator("withdraw_from_isolated_perp_position")) == "255cb2958c4c9f87");
    CHECK(hex_of(anchor_discriminator("place_perp_order")) == "45a15dca787e4cb9");
}

TEST_CASE("kind labels", "[driftgate][decoding][instruction]") {
    CHECK(kind_label(InstructionKind::kDepositIntoIsolatedPerpPosition) == "depositIntoIsolatedPerpPosition");
    CHECK(kind_label(InstructionKind::kWithdrawFromIsolatedPerpPosition) == "withdrawFromIsolatedPerpPosition");
    CHECK(kind_label(InstructionKind::kPlacePerpOrder) == "placePerpOrder");
    CHECK(kind_from_label("placePerpOrder") == InstructionKind::kPlacePerpOrder);
    CHECK(kind_from_label("cancelOrder") == std::nullopt);
}

TEST_CASE("account names", "[driftgate][decoding][instruction]") {
    CHECK(account_names(InstructionKind::kDepositIntoIsolatedPerpPosition).size() == 7);
    CHECK(account_names(InstructionKind::kWithdrawFromIsolatedPerpPosition).size() == 8);
    CHECK(account_names(InstructionKind::kWithdrawFromIsolatedPerpPosition)[5] == "driftSigner");
    CHECK(account_names(InstructionKind::kWithdrawFromIsolatedPerpPosition)[6] == "userTokenAccount");
    CHECK(account_names(InstructionKind::kPlacePerpOrder) == std::vector<std::string_view>{"state", "user", "authority"});
}

TEST_CASE("bit flag labels", "[driftgate][decoding][instruction]") {
    CHECK(bit_flag_labels(0).empty());
    CHECK(bit_flag_labels(0b01) == std::vector<std::string_view>{"ImmediateOrCancel"});
    CHECK(bit_flag_labels(0b10) == std::vector<std::string_view>{"UpdateHighLeverageMode"});
    CHECK(bit_flag_labels(0b11) == std::vector<std::string_view>{"ImmediateOrCancel", "UpdateHighLeverageMode"});
    CHECK(bit_flag_labels(0b100).empty());
}

TEST_CASE("decode isolated perp movement", "[driftgate][decoding][instruction]") {
    SECTION("deposit layout") {
        const auto data = *from_hex("6530ff997f79aa1a" "0000" "0100" "40420f0000000000");
        const auto decoded = decode_instruction(data);
        REQUIRE(decoded);
        CHECK(decoded->kind == InstructionKind::kDepositIntoIsolatedPerpPosition);
        const auto& args = std::get<IsolatedPerpMovementArgs>(decoded->args);
        CHECK(args.spot_market_index == 0);
        CHECK(args.perp_market_index == 1);
        CHECK(args.amount == 1'000'000);
    }

    SECTION("withdraw round trip") {
        const DecodedInstruction instruction{InstructionKind::kWithdrawFromIsolatedPerpPosition,
                                             IsolatedPerpMovementArgs{3, 4, 0xffffffffffffffff}};
        const auto data = encode_instruction(instruction);
        CHECK(data.size() == 20);
        CHECK(decode_instruction(data) == instruction);
    }
}

TEST_CASE("decode place perp order", "[driftgate][decoding][instruction]") {
    SECTION("all options absent") {
        OrderParams params;
        params.base_asset_amount = 5;
        const DecodedInstruction instruction{InstructionKind::kPlacePerpOrder, params};
        const auto data = encode_instruction(instruction);
        // 8 + 3 enums + u8 + 2 * u64 + u16 + bool + post only + flags + 6 option tags + trigger condition
        CHECK(data.size() == 8 + 3 + 1 + 16 + 2 + 1 + 1 + 1 + 6 + 1);
        const auto decoded = decode_instruction(data);
        REQUIRE(decoded);
        CHECK(*decoded == instruction);
        const auto& order = std::get<OrderParams>(decoded->args);
        CHECK(!order.max_ts);
        CHECK(!order.auction_end_price);
    }

    SECTION("options present") {
        const DecodedInstruction instruction{InstructionKind::kPlacePerpOrder, sample_order_params()};
        const auto decoded = decode_instruction(encode_instruction(instruction));
        REQUIRE(decoded);
        const auto& order = std::get<OrderParams>(decoded->args);
        CHECK(order.direction == PositionDirection::kShort);
        CHECK(order.max_ts == 1'700'000'000);
        CHECK(order.oracle_price_offset == -5'000);
        CHECK(order.auction_duration == 10);
        CHECK(!order.trigger_price);
        CHECK(*decoded == instruction);
    }
}

TEST_CASE("decode unknown discriminator", "[driftgate][decoding][instruction]") {
    CHECK(decode_instruction(Bytes(8, 0)) == std::nullopt);
    CHECK(decode_instruction(Bytes(32, 0xff)) == std::nullopt);
}

TEST_CASE("decode malformed payloads", "[driftgate][decoding][instruction]") {
    SECTION("shorter than discriminator") {
        CHECK_THROWS_AS(decode_instruction(Bytes{}), DecodeError);
        CHECK_THROWS_WITH(decode_instruction(Bytes(7, 0x65)), Contains("shorter than anchor discriminator"));
    }

    SECTION("truncated movement args") {
        const auto data = *from_hex("255cb2958c4c9f87" "0000" "0100" "40420f");
        CHECK_THROWS_AS(decode_instruction(data), DecodeError);
    }

    SECTION("trailing bytes") {
        auto data = encode_instruction({InstructionKind::kDepositIntoIsolatedPerpPosition, IsolatedPerpMovementArgs{}});
        data.push_back(0);
        CHECK_THROWS_WITH(decode_instruction(data), Contains("trailing bytes"));
    }

    SECTION("enum discriminant out of range") {
        auto data = encode_instruction({InstructionKind::kPlacePerpOrder, OrderParams{}});
        data[8] = static_cast<uint8_t>(kOrderTypeCount);
        CHECK_THROWS_WITH(decode_instruction(data), Contains("OrderType"));
    }

    SECTION("invalid option tag") {
        auto data = encode_instruction({InstructionKind::kPlacePerpOrder, OrderParams{}});
        // max_ts tag follows discriminator, 3 enums, u8, 2 * u64, u16, bool, post only and flags
        data[8 + 3 + 1 + 16 + 2 + 1 + 1 + 1] = 2;
        CHECK_THROWS_WITH(decode_instruction(data), Contains("invalid option tag"));
    }

    SECTION("invalid bool") {
        auto data = encode_instruction({InstructionKind::kPlacePerpOrder, OrderParams{}});
        data[8 + 3 + 1 + 16 + 2] = 2;
        CHECK_THROWS_WITH(decode_instruction(data), Contains("invalid bool"));
    }
}

TEST_CASE("encode mismatched arguments", "[driftgate][decoding][instruction]") {
    CHECK_THROWS_AS(encode_instruction({InstructionKind::kPlacePerpOrder, IsolatedPerpMovementArgs{}}),
                    std::invalid_argument);
    CHECK_THROWS_AS(encode_instruction({InstructionKind::kDepositIntoIsolatedPerpPosition, OrderParams{}}),
                    std::invalid_argument);
}

TEST_CASE("print decoded instruction", "[driftgate][decoding][instruction]") {
    std::ostringstream out;
    out << DecodedInstruction{InstructionKind::kWithdrawFromIsolatedPerpPosition, IsolatedPerpMovementArgs{0, 1, 42}};
    CHECK_THAT(out.str(), Contains("withdrawFromIsolatedPerpPosition"));
    CHECK_THAT(out.str(), Contains("amount=42"));
}

} // namespace driftgate::decoding
