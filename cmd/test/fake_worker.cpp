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

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <nlohmann/json.hpp>

// Scripted stand-in for the transaction builder worker, speaking the line protocol on stdin/stdout.
// Function names drive the reply: fail, fail_silently, no_result, ignore, noisy, slow; anything else is echoed.

ABSL_FLAG(std::string, mode, "echo", "reply mode: echo, reversed, crash_on_start");
ABSL_FLAG(int, crash_after, 0, "exit on receiving the n-th request without replying (0 disables)");
ABSL_FLAG(int, delay_ms, 0, "milliseconds the slow function waits before echoing");

namespace {

void reply(const nlohmann::json& response) {
    std::cout << response.dump() << std::endl;
}

std::optional<nlohmann::json> make_reply(const nlohmann::json& request) {
    const auto id = request.at("id").get<std::string>();
    const auto function = request.at("fn").get<std::string>();
    const auto& args = request.at("args");

    if (function == "ignore") {
        return std::nullopt;
    }
    if (function == "fail") {
        return nlohmann::json{{"id", id}, {"ok", false}, {"error", {{"message", args.value("message", "failed")}}}};
    }
    if (function == "fail_silently") {
        return nlohmann::json{{"id", id}, {"ok", false}};
    }
    if (function == "no_result") {
        return nlohmann::json{{"id", id}, {"ok", true}};
    }
    if (function == "slow") {
        std::this_thread::sleep_for(std::chrono::milliseconds{absl::GetFlag(FLAGS_delay_ms)});
    }
    if (function == "noisy") {
        std::cout << "worker log line that is not json" << std::endl;
        reply({{"id", "00000000-0000-4000-8000-000000000000"}, {"ok", true}, {"result", 0}});
    }
    return nlohmann::json{{"id", id}, {"ok", true}, {"result", {{"fn", function}, {"args", args}}}};
}

} // namespace

int main(int argc, char* argv[]) {
    absl::SetProgramUsageMessage("Fake transaction builder worker for bridge tests");
    absl::ParseCommandLine(argc, argv);

    const auto mode{absl::GetFlag(FLAGS_mode)};
    const auto crash_after{absl::GetFlag(FLAGS_crash_after)};
    if (mode == "crash_on_start") {
        return EXIT_FAILURE;
    }
    const bool reversed = mode == "reversed";

    std::optional<nlohmann::json> held_reply;
    int received{0};
    std::string line;
    while (std::getline(std::cin, line)) {
        ++received;
        if (crash_after > 0 && received >= crash_after) {
            std::cerr << "fake worker crashing after " << received << " requests\n";
            return EXIT_FAILURE;
        }

        std::optional<nlohmann::json> response;
        try {
            response = make_reply(nlohmann::json::parse(line));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "fake worker bad request: " << e.what() << "\n";
            continue;
        }
        if (!response) {
            continue;
        }
        if (!reversed) {
            reply(*response);
        } else if (!held_reply) {
            held_reply = std::move(response);
        } else {
            reply(*response);
            reply(*held_reply);
            held_reply.reset();
        }
    }
    return EXIT_SUCCESS;
}
