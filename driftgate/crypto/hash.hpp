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

#ifndef DRIFTGATE_CRYPTO_HASH_HPP_
#define DRIFTGATE_CRYPTO_HASH_HPP_

#include <array>
#include <cstdint>

#include <driftgate/common/base.hpp>

namespace driftgate::crypto {

constexpr std::size_t kSha256Length{32};

using Sha256Digest = std::array<uint8_t, kSha256Length>;

Sha256Digest sha256(ByteView data);

} // namespace driftgate::crypto

#endif // DRIFTGATE_CRYPTO_HASH_HPP_
