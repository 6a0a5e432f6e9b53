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

#include "backfill.hpp"

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <driftgate/common/log.hpp>
#include <driftgate/decoding/instruction.hpp>
#include <driftgate/rpc/error.hpp>
#include <driftgate/storage/memory_action_store.hpp>
#include <driftgate/test/mock_rpc.hpp>
#include <driftgate/types/transaction.hpp>

namespace driftgate::indexing {

using testing::_;
using testing::Eq;
using testing::InvokeWithoutArgs;
using testing::Return;

static std::string signature_of(uint8_t fill) {
    Signature signature;
    signature.bytes.fill(fill);
    return signature.to_base58();
}

static rpc::SignatureInfo info_of(uint8_t fill, uint64_t slot) {
    return {signature_of(fill), slot, std::nullopt, false};
}

static boost::asio::awaitable<std::vector<rpc::SignatureInfo>> page(std::vector<rpc::SignatureInfo> infos) {
    co_return infos;
}

TEST_CASE("fetch signatures", "[driftgate][indexing][backfill]") {
    DRIFTGATE_LOG_STREAMS(null_stream(), null_stream());
    test::MockSignatureSource source;
    boost::asio::thread_pool pool{1};
    const std::optional<std::string> latest;

    SECTION("pages until empty and drops duplicates") {
        EXPECT_CALL(source, get_signatures_for_address("wallet", latest, 10))
            .WillOnce(InvokeWithoutArgs([]() { return page({info_of(1, 30), info_of(2, 20)}); }));
        EXPECT_CALL(source, get_signatures_for_address("wallet", Eq(std::optional{signature_of(2)}), 8))
            .WillOnce(InvokeWithoutArgs([]() { return page({info_of(2, 20), info_of(3, 10)}); }));
        EXPECT_CALL(source, get_signatures_for_address("wallet", Eq(std::optional{signature_of(3)}), 7))
            .WillOnce(InvokeWithoutArgs([]() { return page({}); }));

        auto result = boost::asio::co_spawn(pool, fetch_signatures(source, "wallet", 10), boost::asio::use_future);
        CHECK(result.get() == std::vector<std::string>{signature_of(1), signature_of(2), signature_of(3)});
    }

    SECTION("stops at the limit") {
        EXPECT_CALL(source, get_signatures_for_address("wallet", latest, 2))
            .WillOnce(InvokeWithoutArgs([]() { return page({info_of(1, 30), info_of(2, 20), info_of(3, 10)}); }));

        auto result = boost::asio::co_spawn(pool, fetch_signatures(source, "wallet", 2), boost::asio::use_future);
        CHECK(result.get().size() == 2);
    }

    SECTION("page size is capped") {
        EXPECT_CALL(source, get_signatures_for_address("wallet", latest, 1000))
            .WillOnce(InvokeWithoutArgs([]() { return page({}); }));
        auto result = boost::asio::co_spawn(pool, fetch_signatures(source, "wallet", 5000), boost::asio::use_future);
        CHECK(result.get().empty());
    }
}

TEST_CASE("backfill", "[driftgate][indexing][backfill]") {
    DRIFTGATE_LOG_STREAMS(null_stream(), null_stream());
    DRIFTGATE_LOG_VERBOSITY(LogLevel::None);
    test::MockTransactionSource source;
    decoding::Decoder decoder{source};
    storage::MemoryActionStore store;
    boost::asio::thread_pool pool{1};

    Message message;
    message.header = {1, 0, 1};
    PublicKey user;
    user.bytes.fill(0x11);
    message.account_keys = {user, decoding::default_program_id()};
    message.instructions.push_back({1, {0}, decoding::encode_instruction(
        {decoding::InstructionKind::kDepositIntoIsolatedPerpPosition, decoding::IsolatedPerpMovementArgs{0, 2, 1'000}})});
    FetchedTransaction fetched;
    fetched.slot = 77;
    fetched.transaction = encode_transaction({{Signature{}}, message});
    fetched.meta = TransactionMeta{};

    EXPECT_CALL(source, get_transaction(signature_of(1), _)).Times(2).WillRepeatedly(InvokeWithoutArgs([&]() -> boost::asio::awaitable<FetchedTransaction> {
        co_return fetched;
    }));
    EXPECT_CALL(source, get_transaction(signature_of(2), _)).WillOnce(InvokeWithoutArgs([]() -> boost::asio::awaitable<FetchedTransaction> {
        throw rpc::RpcError{"transaction not found"};
        co_return FetchedTransaction{};
    }));

    const std::vector<std::string> signatures{signature_of(1), signature_of(2), "not-a-signature"};
    auto result = boost::asio::co_spawn(pool, backfill(decoder, store, signatures), boost::asio::use_future);
    const auto report = result.get();
    CHECK(report.decoded == 1);
    CHECK(report.failed == 2);
    CHECK(report.rows == 1);
    REQUIRE(report.actions.size() == 1);
    CHECK(report.actions[0].action_type == "depositIntoIsolatedPerpPosition");
    CHECK(report.actions[0].slot == 77);

    // Re-running upserts instead of duplicating
    auto again = boost::asio::co_spawn(pool, backfill(decoder, store, {signature_of(1)}), boost::asio::use_future);
    CHECK(again.get().rows == 1);
    CHECK(store.size() == 1);
}

} // namespace driftgate::indexing
