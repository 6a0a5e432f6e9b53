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
#include <string>
#include <utility>

#include <openssl/evp.h>

namespace driftgate::crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

void Keypair::PkeyDeleter::operator()(EVP_PKEY* pkey) const {
    EVP_PKEY_free(pkey);
}

Keypair::Keypair(std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey, PublicKey public_key)
    : pkey_{std::move(pkey)}, public_key_{public_key} {}

Keypair Keypair::from_seed(ByteView seed) {
    if (seed.size() != kPublicKeyLength) {
        throw std::invalid_argument{"ed25519 seed must be " + std::to_string(kPublicKeyLength) + " bytes, got " +
            std::to_string(seed.size())};
    }
    std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey{
        EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size())};
    if (!pkey) {
        throw std::invalid_argument{"ed25519 seed rejected by EVP_PKEY_new_raw_private_key"};
    }

    PublicKey public_key;
    std::size_t public_key_length{public_key.bytes.size()};
    if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.bytes.data(), &public_key_length) != 1 ||
        public_key_length != kPublicKeyLength) {
        throw std::invalid_argument{"cannot derive ed25519 public key"};
    }
    return Keypair{std::move(pkey), public_key};
}

Keypair Keypair::from_bytes(ByteView secret_key) {
    if (secret_key.size() != kKeypairLength) {
        throw std::invalid_argument{"keypair must be " + std::to_string(kKeypairLength) + " bytes, got " +
            std::to_string(secret_key.size())};
    }
    auto keypair = from_seed(secret_key.substr(0, kPublicKeyLength));
    if (keypair.public_key().view() != secret_key.substr(kPublicKeyLength)) {
        throw std::invalid_argument{"keypair public key does not match its secret seed"};
    }
    return keypair;
}

Signature Keypair::sign(ByteView message) const {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw std::runtime_error{"EVP_MD_CTX_new failed"};
    }
    // Ed25519 hashes internally, no message digest is configured
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) != 1) {
        throw std::runtime_error{"EVP_DigestSignInit failed"};
    }
    Signature signature;
    std::size_t signature_length{signature.bytes.size()};
    if (EVP_DigestSign(ctx.get(), signature.bytes.data(), &signature_length, message.data(), message.size()) != 1 ||
        signature_length != kSignatureLength) {
        throw std::runtime_error{"EVP_DigestSign failed"};
    }
    return signature;
}

} // namespace driftgate::crypto
