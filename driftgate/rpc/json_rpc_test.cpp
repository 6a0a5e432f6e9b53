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

#include "json_rpc.hpp"

#include <stdexcept>

#include <catch2/catch.hpp>

#include <driftgate/rpc/error.hpp>

namespace driftgate::rpc {

TEST_CASE("parse url", "[driftgate][rpc][json_rpc]") {
    SECTION("https default port") {
        const auto endpoint = parse_url("https://api.devnet.solana.com");
        CHECK(endpoint.tls);
        CHECK(endpoint.host == "api.devnet.solana.com");
        CHECK(endpoint.port == "443");
        CHECK(endpoint.target == "/");
    }

    SECTION("http with port and path") {
        const auto endpoint = parse_url("http://127.0.0.1:8899/rpc?key=abc");
        CHECK(!endpoint.tls);
        CHECK(endpoint.host == "127.0.0.1");
        CHECK(endpoint.port == "8899");
        CHECK(endpoint.target == "/rpc?key=abc");
    }

    SECTION("invalid") {
        CHECK_THROWS_AS(parse_url("ws://localhost:8900"), std::invalid_argument);
        CHECK_THROWS_AS(parse_url("http://:8899"), std::invalid_argument);
        CHECK_THROWS_AS(parse_url("http://localhost:/"), std::invalid_argument);
    }
}

TEST_CASE("make request", "[driftgate][rpc][json_rpc]") {
    const auto request = make_request(7, "getSlot", nlohmann::json::array());
    CHECK(nlohmann::json::parse(request) == R"({"jsonrpc":"2.0","id":7,"method":"getSlot","params":[]})"_json);
}

TEST_CASE("extract result", "[driftgate][rpc][json_rpc]") {
    SECTION("result") {
        CHECK(extract_result(R"({"jsonrpc":"2.0","id":1,"result":{"value":42}})") == R"({"value":42})"_json);
        CHECK(extract_result(R"({"jsonrpc":"2.0","id":1,"result":null})").is_null());
    }

    SECTION("error object") {
        try {
            extract_result(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32602,"message":"Invalid params"}})");
            FAIL("expected RpcError");
        } catch (const RpcError& e) {
            CHECK(std::string{e.what()} == "Invalid params");
            CHECK(e.code() == -32602);
            CHECK(!e.is_preflight_failure());
        }
    }

    SECTION("preflight failure") {
        try {
            extract_result(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32002,
                "message":"Transaction simulation failed: Error processing Instruction 0",
                "data":{"logs":["Program log: insufficient collateral"]}}})");
            FAIL("expected RpcError");
        } catch (const RpcError& e) {
            CHECK(e.is_preflight_failure());
            CHECK(std::string{e.what()}.find("insufficient collateral") != std::string::npos);
        }
    }

    SECTION("malformed body") {
        CHECK_THROWS_AS(extract_result("<html>502 Bad Gateway</html>"), RpcError);
        CHECK_THROWS_AS(extract_result("[]"), RpcError);
        CHECK_THROWS_AS(extract_result(R"({"jsonrpc":"2.0","id":1})"), RpcError);
    }
}

TEST_CASE("preflight detection", "[driftgate][rpc][json_rpc]") {
    CHECK(is_preflight_failure(-32002, "anything"));
    CHECK(is_preflight_failure(-32003, "Transaction simulation failed: Blockhash not found"));
    CHECK(!is_preflight_failure(-32005, "Node is behind"));
}

TEST_CASE("signature status", "[driftgate][rpc][json_rpc]") {
    SECTION("unknown signature") {
        CHECK(!parse_signature_status(R"({"context":{"slot":1},"value":[null]})"_json));
    }

    SECTION("confirmed") {
        const auto status = parse_signature_status(
            R"({"context":{"slot":10},"value":[{"slot":9,"confirmations":1,"err":null,"confirmationStatus":"confirmed"}]})"_json);
        REQUIRE(status);
        CHECK(status->slot == 9u);
        CHECK(!status->err);
        CHECK(status->confirmation_status == "confirmed");
    }

    SECTION("failed") {
        const auto status = parse_signature_status(
            R"({"context":{"slot":10},"value":[{"slot":9,"err":{"InstructionError":[0,{"Custom":6010}]},"confirmationStatus":"processed"}]})"_json);
        REQUIRE(status);
        CHECK(status->err == R"({"InstructionError":[0,{"Custom":6010}]})");
    }

    SECTION("commitment levels") {
        CHECK(commitment_reached("confirmed", "confirmed"));
        CHECK(commitment_reached("finalized", "confirmed"));
        CHECK(!commitment_reached("processed", "confirmed"));
        CHECK(!commitment_reached("", "processed"));
    }
}

TEST_CASE("signatures for address", "[driftgate][rpc][json_rpc]") {
    const auto signatures = parse_signatures(R"([
        {"signature":"sig2","slot":200,"err":null,"blockTime":1700000200,"memo":null,"confirmationStatus":"finalized"},
        {"signature":"sig1","slot":100,"err":{"InstructionError":[0,"Custom"]},"blockTime":null}
    ])"_json);
    REQUIRE(signatures.size() == 2);
    CHECK(signatures[0].signature == "sig2");
    CHECK(signatures[0].slot == 200);
    CHECK(signatures[0].block_time == 1700000200);
    CHECK(!signatures[0].failed);
    CHECK(!signatures[1].block_time);
    CHECK(signatures[1].failed);

    CHECK_THROWS_AS(parse_signatures(R"({"value":[]})"_json), RpcError);
    CHECK_THROWS_AS(parse_signatures(R"([{"slot":1}])"_json), RpcError);
}

TEST_CASE("fetched transaction result", "[driftgate][rpc][json_rpc]") {
    CHECK_THROWS_WITH(parse_fetched_transaction("sig", nlohmann::json{}), "transaction not found: sig");
    CHECK_THROWS_AS(parse_fetched_transaction("sig", R"({"slot":1,"transaction":["AA==","base58"]})"_json), RpcError);

    const auto fetched = parse_fetched_transaction("sig", R"({"slot":5,"blockTime":null,"transaction":["AQID","base64"],"meta":null})"_json);
    CHECK(fetched.slot == 5);
    CHECK(fetched.transaction == Bytes{0x01, 0x02, 0x03});
}

} // namespace driftgate::rpc
