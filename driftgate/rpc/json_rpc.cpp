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

#include "json_rpc.hpp"

#include <stdexcept>
#include <utility>

#include <driftgate/json/types.hpp>
#include <driftgate/rpc/error.hpp>

namespace driftgate::rpc {

constexpr const char* kHttpScheme{"http://"};
constexpr const char* kHttpsScheme{"https://"};
constexpr const char* kPreflightFailureMessage{"Transaction simulation failed"};
constexpr int64_t kPreflightFailureCode{-32002};

Endpoint parse_url(const std::string& url) {
    Endpoint endpoint;
    std::string rest;
    if (url.rfind(kHttpsScheme, 0) == 0) {
        endpoint.tls = true;
        rest = url.substr(std::string{kHttpsScheme}.size());
    } else if (url.rfind(kHttpScheme, 0) == 0) {
        rest = url.substr(std::string{kHttpScheme}.size());
    } else {
        throw std::invalid_argument{"unsupported url scheme: " + url};
    }

    const auto path_start = rest.find('/');
    const auto authority = rest.substr(0, path_start);
    endpoint.target = path_start == std::string::npos ? "/" : rest.substr(path_start);

    const auto port_start = authority.rfind(':');
    if (port_start == std::string::npos) {
        endpoint.host = authority;
        endpoint.port = endpoint.tls ? "443" : "80";
    } else {
        endpoint.host = authority.substr(0, port_start);
        endpoint.port = authority.substr(port_start + 1);
    }
    if (endpoint.host.empty() || endpoint.port.empty()) {
        throw std::invalid_argument{"invalid url: " + url};
    }
    return endpoint;
}

std::string make_request(uint64_t id, const std::string& method, const nlohmann::json& params) {
    const nlohmann::json request{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return request.dump();
}

bool is_preflight_failure(int64_t code, const std::string& message) {
    return code == kPreflightFailureCode || message.find(kPreflightFailureMessage) != std::string::npos;
}

nlohmann::json extract_result(const std::string& body) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw RpcError{std::string{"invalid json-rpc response: "} + e.what()};
    }
    if (!response.is_object()) {
        throw RpcError{"invalid json-rpc response: not an object"};
    }

    const auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        const auto code = error->value("code", int64_t{0});
        auto message = error->value("message", std::string{"unknown json-rpc error"});
        const auto data = error->find("data");
        if (data != error->end() && data->is_object()) {
            const auto logs = data->find("logs");
            if (logs != data->end() && logs->is_array() && !logs->empty()) {
                message += " logs: " + logs->dump();
            }
        }
        const bool preflight = is_preflight_failure(code, message);
        throw RpcError{message, code, preflight};
    }

    const auto result = response.find("result");
    if (result == response.end()) {
        throw RpcError{"invalid json-rpc response: missing result"};
    }
    return *result;
}

std::optional<SignatureStatus> parse_signature_status(const nlohmann::json& result) {
    try {
        const auto& value = result.at("value");
        if (!value.is_array() || value.empty() || value[0].is_null()) {
            return std::nullopt;
        }
        const auto& entry = value[0];
        SignatureStatus status;
        if (entry.contains("slot") && !entry["slot"].is_null()) {
            status.slot = entry["slot"].get<uint64_t>();
        }
        if (entry.contains("err") && !entry["err"].is_null()) {
            status.err = entry["err"].dump();
        }
        if (entry.contains("confirmationStatus") && !entry["confirmationStatus"].is_null()) {
            status.confirmation_status = entry["confirmationStatus"].get<std::string>();
        }
        return status;
    } catch (const nlohmann::json::exception& e) {
        throw RpcError{std::string{"invalid getSignatureStatuses result: "} + e.what()};
    }
}

static int commitment_rank(const std::string& level) {
    if (level == "processed") return 1;
    if (level == "confirmed") return 2;
    if (level == "finalized") return 3;
    return 0;
}

bool commitment_reached(const std::string& confirmation_status, const std::string& commitment) {
    const auto reached = commitment_rank(confirmation_status);
    return reached > 0 && reached >= commitment_rank(commitment);
}

FetchedTransaction parse_fetched_transaction(const std::string& signature, const nlohmann::json& result) {
    if (result.is_null()) {
        throw RpcError{"transaction not found: " + signature};
    }
    try {
        return result.get<FetchedTransaction>();
    } catch (const nlohmann::json::exception& e) {
        throw RpcError{"invalid getTransaction result for " + signature + ": " + e.what()};
    } catch (const std::invalid_argument& e) {
        throw RpcError{"invalid getTransaction result for " + signature + ": " + e.what()};
    }
}

std::vector<SignatureInfo> parse_signatures(const nlohmann::json& result) {
    if (!result.is_array()) {
        throw RpcError{"invalid getSignaturesForAddress result: not an array"};
    }
    std::vector<SignatureInfo> signatures;
    try {
        for (const auto& entry : result) {
            SignatureInfo info;
            info.signature = entry.at("signature").get<std::string>();
            info.slot = entry.at("slot").get<uint64_t>();
            if (entry.contains("blockTime") && !entry["blockTime"].is_null()) {
                info.block_time = entry["blockTime"].get<int64_t>();
            }
            info.failed = entry.contains("err") && !entry["err"].is_null();
            signatures.push_back(std::move(info));
        }
    } catch (const nlohmann::json::exception& e) {
        throw RpcError{std::string{"invalid getSignaturesForAddress result: "} + e.what()};
    }
    return signatures;
}

} // namespace driftgate::rpc
