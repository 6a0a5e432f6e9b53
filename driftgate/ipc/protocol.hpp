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

#ifndef DRIFTGATE_IPC_PROTOCOL_HPP_
#define DRIFTGATE_IPC_PROTOCOL_HPP_

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace driftgate::ipc {

//! Random UUID v4 in canonical textual form
std::string make_correlation_id();

//! One request line: {"id","fn","args"} followed by a newline
std::string encode_request(const std::string& id, const std::string& function, const nlohmann::json& args);

struct WorkerResponse {
    std::string id;
    bool ok{false};
    std::optional<nlohmann::json> result;
    std::optional<std::string> error_message;
};

void from_json(const nlohmann::json& json, WorkerResponse& response);

//! Parse one stdout line. Throws IpcError(protocol) if the line is not a response object.
WorkerResponse parse_response(const std::string& line);

//! The call outcome carried by a response: the result, or IpcError(protocol) / IpcError(remote).
nlohmann::json unwrap_response(WorkerResponse response);

} // namespace driftgate::ipc

#endif // DRIFTGATE_IPC_PROTOCOL_HPP_
