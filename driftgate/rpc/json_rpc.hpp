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

#ifndef DRIFTGATE_RPC_JSON_RPC_HPP_
#define DRIFTGATE_RPC_JSON_RPC_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <driftgate/rpc/interfaces.hpp>
#include <driftgate/types/fetched_transaction.hpp>

namespace driftgate::rpc {

struct Endpoint {
    bool tls{false};
    std::string host;
    std::string port;
    std::string target;
};

//! Split an http or https URL into connection parameters. Throws std::invalid_argument.
Endpoint parse_url(const std::string& url);

std::string make_request(uint64_t id, const std::string& method, const nlohmann::json& params);

//! The result member of a JSON-RPC 2.0 response body. Throws RpcError for an error member or malformed body.
nlohmann::json extract_result(const std::string& body);

//! Node error messages signalling rejection during simulation, before broadcast
bool is_preflight_failure(int64_t code, const std::string& message);

struct SignatureStatus {
    std::optional<uint64_t> slot;
    std::optional<std::string> err;
    std::string confirmation_status;
};

//! First entry of a getSignatureStatuses result, empty while the node has not seen the signature
std::optional<SignatureStatus> parse_signature_status(const nlohmann::json& result);

//! True when confirmation status has reached the commitment level (processed < confirmed < finalized)
bool commitment_reached(const std::string& confirmation_status, const std::string& commitment);

FetchedTransaction parse_fetched_transaction(const std::string& signature, const nlohmann::json& result);

std::vector<SignatureInfo> parse_signatures(const nlohmann::json& result);

} // namespace driftgate::rpc

#endif // DRIFTGATE_RPC_JSON_RPC_HPP_
