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

#include "pubkey.hpp"

#include <algorithm>

#include <driftgate/common/util.hpp>

namespace driftgate {

std::optional<PublicKey> PublicKey::from_base58(std::string_view encoded) {
    const auto decoded = base58_decode(encoded);
    if (!decoded) {
        return std::nullopt;
    }
    return from_bytes(*decoded);
}

std::optional<PublicKey> PublicKey::from_bytes(ByteView bytes) {
    if (bytes.size() != kPublicKeyLength) {
        return std::nullopt;
    }
    PublicKey key;
    std::copy(bytes.begin(), bytes.end(), key.bytes.begin());
    return key;
}

std::string PublicKey::to_base58() const {
    return base58_encode(view());
}

std::ostream& operator<<(std::ostream& out, const PublicKey& key) {
    out << key.to_base58();
    return out;
}

std::optional<Signature> Signature::from_base58(std::string_view encoded) {
    const auto decoded = base58_decode(encoded);
    if (!decoded || decoded->size() != kSignatureLength) {
        return std::nullopt;
    }
    Signature signature;
    std::copy(decoded->begin(), decoded->end(), signature.bytes.begin());
    return signature;
}

std::string Signature::to_base58() const {
    return base58_encode(view());
}

std::ostream& operator<<(std::ostream& out, const Signature& signature) {
    out << signature.to_base58();
    return out;
}

} // namespace driftgate
