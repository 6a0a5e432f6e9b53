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

#ifndef DRIFTGATE_TYPES_PUBKEY_HPP_
#define DRIFTGATE_TYPES_PUBKEY_HPP_

#include <array>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <driftgate/common/base.hpp>

namespace driftgate {

struct PublicKey {
    std::array<uint8_t, kPublicKeyLength> bytes{};

    static std::optional<PublicKey> from_base58(std::string_view encoded);
    static std::optional<PublicKey> from_bytes(ByteView bytes);

    std::string to_base58() const;

    ByteView view() const { return {bytes.data(), bytes.size()}; }
};

inline bool operator==(const PublicKey& lhs, const PublicKey& rhs) { return lhs.bytes == rhs.bytes; }
inline bool operator!=(const PublicKey& lhs, const PublicKey& rhs) { return lhs.bytes != rhs.bytes; }

std::ostream& operator<<(std::ostream& out, const PublicKey& key);

struct Signature {
    std::array<uint8_t, kSignatureLength> bytes{};

    static std::optional<Signature> from_base58(std::string_view encoded);

    std::string to_base58() const;

    ByteView view() const { return {bytes.data(), bytes.size()}; }
};

inline bool operator==(const Signature& lhs, const Signature& rhs) { return lhs.bytes == rhs.bytes; }
inline bool operator!=(const Signature& lhs, const Signature& rhs) { return lhs.bytes != rhs.bytes; }

std::ostream& operator<<(std::ostream& out, const Signature& signature);

} // namespace driftgate

#endif // DRIFTGATE_TYPES_PUBKEY_HPP_
