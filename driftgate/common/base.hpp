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

#ifndef DRIFTGATE_COMMON_BASE_HPP_
#define DRIFTGATE_COMMON_BASE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace driftgate {

using Bytes = std::basic_string<uint8_t>;

using ByteView = std::basic_string_view<uint8_t>;

constexpr std::size_t kPublicKeyLength{32};
constexpr std::size_t kSignatureLength{64};
constexpr std::size_t kKeypairLength{64};
constexpr std::size_t kDiscriminatorLength{8};

} // namespace driftgate

#endif  // DRIFTGATE_COMMON_BASE_HPP_
