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

#ifndef DRIFTGATE_CRYPTO_KEYPAIR_HPP_
#define DRIFTGATE_CRYPTO_KEYPAIR_HPP_

#include <memory>

#include <driftgate/common/base.hpp>
#include <driftgate/types/pubkey.hpp>

typedef struct evp_pkey_st EVP_PKEY;

namespace driftgate::crypto {

//! Ed25519 signing key, immutable after construction.
class Keypair {
  public:
    //! Build from the 64-byte secret key layout: 32-byte seed followed by the 32-byte public key.
    //! Throws std::invalid_argument if the length is wrong or the public half does not match the seed.
    static Keypair from_bytes(ByteView secret_key);

    //! Build from the 32-byte seed only.
    static Keypair from_seed(ByteView seed);

    Keypair(Keypair&&) noexcept = default;
    Keypair& operator=(Keypair&&) noexcept = default;

    const PublicKey& public_key() const noexcept { return public_key_; }

    Signature sign(ByteView message) const;

  private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* pkey) const;
    };

    Keypair(std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey, PublicKey public_key);

    std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey_;
    PublicKey public_key_;
};

} // namespace driftgate::crypto

#endif // DRIFTGATE_CRYPTO_KEYPAIR_HPP_
