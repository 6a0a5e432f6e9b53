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

#ifndef DRIFTGATE_EXECUTION_KEY_LOADER_HPP_
#define DRIFTGATE_EXECUTION_KEY_LOADER_HPP_

#include <optional>
#include <string>
#include <string_view>

#include <driftgate/crypto/keypair.hpp>

namespace driftgate::execution {

//! Parse 64 bytes of key material given as a JSON byte array, a comma separated byte list or base58,
//! tried in that order. Throws ExecutorError(invalid_key).
crypto::Keypair load_keypair(std::string_view key);

//! As load_keypair, with ExecutorError(missing_key) when no key is configured.
crypto::Keypair load_server_keypair(const std::optional<std::string>& configured_key);

} // namespace driftgate::execution

#endif // DRIFTGATE_EXECUTION_KEY_LOADER_HPP_
