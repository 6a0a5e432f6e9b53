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

#ifndef DRIFTGATE_COMMON_UTIL_HPP_
#define DRIFTGATE_COMMON_UTIL_HPP_

#include <optional>
#include <string>
#include <string_view>

#include <driftgate/common/base.hpp>

namespace driftgate {

inline ByteView byte_view_of_string(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.length()};
}

inline Bytes bytes_of_string(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

std::string to_hex(ByteView bytes);
std::optional<Bytes> from_hex(std::string_view hex);

std::string base64_encode(const uint8_t* bytes_to_encode, size_t len, bool url = false);
inline std::string base64_encode(ByteView bytes) { return base64_encode(bytes.data(), bytes.size()); }

//! Decode standard base64 with mandatory padding, empty if any character or length is invalid
std::optional<Bytes> base64_decode(std::string_view encoded);

std::string base58_encode(ByteView bytes);

//! Decode Bitcoin-alphabet base58, empty if any character is outside the alphabet
std::optional<Bytes> base58_decode(std::string_view encoded);

//! Bytes rendered as colon-separated lowercase hex pairs, e.g. 0a:ff:01
std::string to_colon_hex(ByteView bytes);

std::string trim(std::string_view s);

//! The flag value if not empty, otherwise the environment variable if set and not empty, otherwise the fallback
std::string value_or_env(const std::string& value, const char* env_name, const std::string& fallback = {});

} // namespace driftgate

#endif // DRIFTGATE_COMMON_UTIL_HPP_
