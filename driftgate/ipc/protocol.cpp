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

#include "protocol.hpp"

#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <driftgate/ipc/error.hpp>

namespace driftgate::ipc {

constexpr const char* kMissingErrorMessage{"worker error without message"};

std::string make_correlation_id() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string encode_request(const std::string& id, const std::string& function, const nlohmann::json& args) {
    const nlohmann::json request{{"id", id}, {"fn", function}, {"args", args}};
    return request.dump() + "\n";
}

void from_json(const nlohmann::json& json, WorkerResponse& response) {
    response.id = json.at("id").get<std::string>();
    response.ok = json.at("ok").get<bool>();
    const auto result = json.find("result");
    if (result != json.end() && !result->is_null()) {
        response.result = *result;
    }
    const auto error = json.find("error");
    if (error != json.end() && error->is_object()) {
        const auto message = error->find("message");
        if (message != error->end() && message->is_string()) {
            response.error_message = message->get<std::string>();
        }
    }
}

WorkerResponse parse_response(const std::string& line) {
    try {
        return nlohmann::json::parse(line).get<WorkerResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw IpcError{IpcErrc::protocol, e.what()};
    }
}

nlohmann::json unwrap_response(WorkerResponse response) {
    if (response.ok) {
        if (!response.result) {
            throw IpcError{IpcErrc::protocol, "worker returned ok without result"};
        }
        return std::move(*response.result);
    }
    throw IpcError{IpcErrc::remote, response.error_message.value_or(kMissingErrorMessage)};
}

} // namespace driftgate::ipc
