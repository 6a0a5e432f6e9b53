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

#include "hash.hpp"

#include <stdexcept>

#include <openssl/evp.h>

namespace driftgate::crypto {

Sha256Digest sha256(ByteView data) {
    Sha256Digest digest{};
    unsigned int digest_length{0};
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error{"sha256: EVP_Digest failed"};
    }
    return digest;
}

} // namespace driftgate::crypto
