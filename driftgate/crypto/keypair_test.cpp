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

#include "keypair.hpp"

#include <stdexcept>

#include <catch2/catch.hpp>

#include <driftgate/common/util.hpp>
#include <driftgate/crypto/hash.hpp>

namespace driftgate::crypto {

// RFC 8032 section 7.1, TEST 1 and TEST 2
static const auto kSeed1{*from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60")};
static const auto kPublic1{*from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a")};
static const auto kSignature1{*from_hex(
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b")};
static const auto kSeed2{*from_hex("4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb")};
static const auto kSignature2{*from_hex(
    "92a009a9f0d4cab8720e820b5f642540a2b27b5416503f8fb3762223ebdb69da085ac1e43e15996e458f3613d0f11d8c387b2eaeb4302aeeb00d291612bb0c00")};

TEST_CASE("sha256 digest", "[driftgate][crypto][hash]") {
    const auto digest = sha256(byte_view_of_string("abc"));
    CHECK(to_hex({digest.data(), digest.size()}) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("keypair from seed", "[driftgate][crypto][keypair]") {
    const auto keypair = Keypair::from_seed(kSeed1);
    CHECK(keypair.public_key().view() == ByteView{kPublic1});
}

TEST_CASE("keypair from 64 bytes", "[driftgate][crypto][keypair]") {
    SECTION("matching halves") {
        const auto keypair = Keypair::from_bytes(kSeed1 + kPublic1);
        CHECK(keypair.public_key().view() == ByteView{kPublic1});
    }

    SECTION("mismatching public half") {
        Bytes wrong_public(32, 0x01);
        CHECK_THROWS_AS(Keypair::from_bytes(kSeed1 + wrong_public), std::invalid_argument);
    }

    SECTION("wrong length") {
        CHECK_THROWS_AS(Keypair::from_bytes(kSeed1), std::invalid_argument);
        CHECK_THROWS_AS(Keypair::from_seed(Bytes(31, 0)), std::invalid_argument);
    }
}

TEST_CASE("ed25519 signature", "[driftgate][crypto][keypair]") {
    SECTION("empty message") {
        const auto keypair = Keypair::from_seed(kSeed1);
        CHECK(keypair.sign(Bytes{}).view() == ByteView{kSignature1});
    }

    SECTION("one byte message") {
        const auto keypair = Keypair::from_seed(kSeed2);
        CHECK(keypair.sign(Bytes{0x72}).view() == ByteView{kSignature2});
    }

    SECTION("deterministic") {
        const auto keypair = Keypair::from_seed(kSeed2);
        CHECK(keypair.sign(byte_view_of_string("drift")) == keypair.sign(byte_view_of_string("drift")));
    }
}

} // namespace driftgate::crypto
