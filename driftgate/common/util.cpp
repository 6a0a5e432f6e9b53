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

#include "util.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <vector>

namespace driftgate {

static const char* kHexDigits{"0123456789abcdef"};

static const char* kBase64Chars[2] = {
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    "+/",

    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    "-_"
};

static const char* kBase58Chars{"123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string to_hex(ByteView bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0f]);
    }
    return out;
}

std::optional<Bytes> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i{0}; i < hex.size(); i += 2) {
        const auto hi = hex_value(hex[i]);
        const auto lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string to_colon_hex(ByteView bytes) {
    std::string out;
    for (std::size_t i{0}; i < bytes.size(); ++i) {
        if (i > 0) {
            out.push_back(':');
        }
        out.push_back(kHexDigits[bytes[i] >> 4]);
        out.push_back(kHexDigits[bytes[i] & 0x0f]);
    }
    return out;
}

std::string base64_encode(const uint8_t* bytes_to_encode, size_t len, bool url) {
    size_t len_encoded = (len +2) / 3 * 4;

    unsigned char trailing_char = url ? '.' : '=';

    // The two alphabets differ only in the last two positions
    const char* base64_chars_ = kBase64Chars[url ? 1 : 0];

    std::string ret;
    ret.reserve(len_encoded);

    unsigned int pos = 0;
    while (pos < len) {
        ret.push_back(base64_chars_[(bytes_to_encode[pos + 0] & 0xfc) >> 2]);

        if (pos + 1 < len) {
           ret.push_back(base64_chars_[((bytes_to_encode[pos + 0] & 0x03) << 4) + ((bytes_to_encode[pos + 1] & 0xf0) >> 4)]);

           if (pos + 2 < len) {
              ret.push_back(base64_chars_[((bytes_to_encode[pos + 1] & 0x0f) << 2) + ((bytes_to_encode[pos + 2] & 0xc0) >> 6)]);
              ret.push_back(base64_chars_[  bytes_to_encode[pos + 2] & 0x3f]);
           } else {
              ret.push_back(base64_chars_[(bytes_to_encode[pos + 1] & 0x0f) << 2]);
              ret.push_back(trailing_char);
           }
        } else {
            ret.push_back(base64_chars_[(bytes_to_encode[pos + 0] & 0x03) << 4]);
            ret.push_back(trailing_char);
            ret.push_back(trailing_char);
        }

        pos += 3;
    }

    return ret;
}

static int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::optional<Bytes> base64_decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(encoded.size() / 4 * 3);
    for (std::size_t pos{0}; pos < encoded.size(); pos += 4) {
        const bool last_quad = pos + 4 == encoded.size();
        std::array<int, 4> sextets{};
        std::size_t padding{0};
        for (std::size_t i{0}; i < 4; ++i) {
            const char c = encoded[pos + i];
            if (c == '=' && last_quad && i >= 2) {
                sextets[i] = 0;
                ++padding;
                continue;
            }
            // Padding can only be followed by padding
            if (padding > 0) {
                return std::nullopt;
            }
            sextets[i] = base64_value(c);
            if (sextets[i] < 0) {
                return std::nullopt;
            }
        }
        const uint32_t triple = (sextets[0] << 18) | (sextets[1] << 12) | (sextets[2] << 6) | sextets[3];
        out.push_back(static_cast<uint8_t>((triple >> 16) & 0xff));
        if (padding < 2) {
            out.push_back(static_cast<uint8_t>((triple >> 8) & 0xff));
        }
        if (padding < 1) {
            out.push_back(static_cast<uint8_t>(triple & 0xff));
        }
    }
    return out;
}

std::string base58_encode(ByteView bytes) {
    std::size_t leading_zeros{0};
    while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // log(256) / log(58) ~ 1.37, digits stored little-endian
    std::vector<uint8_t> digits;
    digits.reserve((bytes.size() - leading_zeros) * 138 / 100 + 1);
    for (std::size_t i{leading_zeros}; i < bytes.size(); ++i) {
        uint32_t carry = bytes[i];
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string out(leading_zeros, '1');
    out.reserve(leading_zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(kBase58Chars[*it]);
    }
    return out;
}

std::optional<Bytes> base58_decode(std::string_view encoded) {
    std::size_t leading_ones{0};
    while (leading_ones < encoded.size() && encoded[leading_ones] == '1') {
        ++leading_ones;
    }

    // Bytes stored little-endian while accumulating
    std::vector<uint8_t> bytes;
    bytes.reserve(encoded.size() * 733 / 1000 + 1);
    for (std::size_t i{leading_ones}; i < encoded.size(); ++i) {
        const char* p = std::char_traits<char>::find(kBase58Chars, 58, encoded[i]);
        if (p == nullptr) {
            return std::nullopt;
        }
        uint32_t carry = static_cast<uint32_t>(p - kBase58Chars);
        for (auto& b : bytes) {
            carry += static_cast<uint32_t>(b) * 58;
            b = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    Bytes out(leading_ones, 0);
    out.reserve(leading_ones + bytes.size());
    for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
        out.push_back(*it);
    }
    return out;
}

std::string trim(std::string_view s) {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), std::string_view::reverse_iterator{begin}, is_space).base();
    return std::string{begin, end};
}

std::string value_or_env(const std::string& value, const char* env_name, const std::string& fallback) {
    if (!value.empty()) {
        return value;
    }
    const char* env_value = std::getenv(env_name);
    if (env_value != nullptr && *env_value != '\0') {
        return env_value;
    }
    return fallback;
}

} // namespace driftgate
