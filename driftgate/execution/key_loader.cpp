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

#include "key_loader.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <nlohmann/json.hpp>

#include <driftgate/common/base.hpp>
#include <driftgate/common/util.hpp>
#include <driftgate/execution/error.hpp>

namespace driftgate::execution {

namespace {

uint8_t to_byte(int64_t value) {
    if (value < 0 || value > 255) {
        throw ExecutorError{ExecutorErrc::invalid_key, "byte out of range: " + std::to_string(value)};
    }
    return static_cast<uint8_t>(value);
}

Bytes parse_json_array(std::string_view key) {
    std::vector<int64_t> values;
    try {
        values = nlohmann::json::parse(key).get<std::vector<int64_t>>();
    } catch (const nlohmann::json::exception& e) {
        throw ExecutorError{ExecutorErrc::invalid_key, std::string{"invalid json array: "} + e.what()};
    }
    Bytes bytes;
    bytes.reserve(values.size());
    for (const auto value : values) {
        bytes.push_back(to_byte(value));
    }
    return bytes;
}

Bytes parse_byte_list(std::string_view key) {
    Bytes bytes;
    for (const auto part : absl::StrSplit(absl::string_view{key.data(), key.size()}, ',')) {
        int64_t value{0};
        if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(part), &value)) {
            throw ExecutorError{ExecutorErrc::invalid_key, "invalid byte '" + std::string{part} + "'"};
        }
        bytes.push_back(to_byte(value));
    }
    return bytes;
}

Bytes parse_base58(std::string_view key) {
    auto decoded = base58_decode(key);
    if (!decoded) {
        throw ExecutorError{ExecutorErrc::invalid_key, "invalid base58"};
    }
    return std::move(*decoded);
}

} // namespace

crypto::Keypair load_keypair(std::string_view key) {
    const auto stripped = absl::StripAsciiWhitespace(absl::string_view{key.data(), key.size()});
    const std::string_view trimmed{stripped.data(), stripped.size()};
    if (trimmed.empty()) {
        throw ExecutorError{ExecutorErrc::invalid_key, "empty private key"};
    }

    Bytes secret_key;
    if (trimmed.front() == '[') {
        secret_key = parse_json_array(trimmed);
    } else if (trimmed.find(',') != std::string_view::npos) {
        secret_key = parse_byte_list(trimmed);
    } else {
        secret_key = parse_base58(trimmed);
    }

    try {
        return crypto::Keypair::from_bytes(secret_key);
    } catch (const std::invalid_argument& e) {
        throw ExecutorError{ExecutorErrc::invalid_key, e.what()};
    }
}

crypto::Keypair load_server_keypair(const std::optional<std::string>& configured_key) {
    if (!configured_key) {
        throw ExecutorError{ExecutorErrc::missing_key};
    }
    return load_keypair(std::string_view{*configured_key});
}

} // namespace driftgate::execution
