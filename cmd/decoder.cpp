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

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <nlohmann/json.hpp>

#include <driftgate/common/constants.hpp>
#include <driftgate/common/log.hpp>
#include <driftgate/common/util.hpp>
#include <driftgate/concurrency/context_pool.hpp>
#include <driftgate/decoding/decoder.hpp>
#include <driftgate/json/types.hpp>
#include <driftgate/rpc/json_rpc_client.hpp>

ABSL_FLAG(std::string, rpc_url, "", "Solana JSON-RPC endpoint, falls back to RPC_URL");
ABSL_FLAG(std::string, program_id, "", "Drift program id, falls back to DRIFT_PROGRAM_ID");
ABSL_FLAG(std::string, dump_dir, "decoder-dumps", "directory receiving per-signature dumps and the aggregated action table");
ABSL_FLAG(driftgate::LogLevel, logLevel, driftgate::LogLevel::Warn, "logging level");

// Known devnet transactions, one per supported instruction
static const std::vector<std::string> kSampleSignatures{
    "4mXkvzqN1n8WmF82Xb9C9teZhF6GJeGkUcupNshLFBdiB8idTuWET3BzTtgNZo4bvnPgKbRusQCX9pXjGTpSdF3K",
    "MnmqKomt5SZW2YYmic3aUqi8LFCSr6tGxngsiJfW8s1NTZdmvNrUW6h2C8Uz3D8UuzFeedgsthWSqqvz7rEz8Cv",
    "4w1WV3b8Z1FkE4W5JzyMyc3SR2jLP5jaoDQPNxfDTWZJtR9p5dFSa7zsaDQgDedy2D4DDi8LAY6LXKndRqTHCk5X",
};

static void print_summary(const driftgate::SignatureDump& dump) {
    std::cout << "  Slot: " << dump.slot << "\n";
    if (dump.block_time) {
        std::cout << "  Block time (unix): " << *dump.block_time << "\n";
    }
    for (const auto& instruction : dump.instructions) {
        const auto label = instruction.decoded ? std::string{driftgate::decoding::kind_label(instruction.decoded->kind)}
                                               : std::string{"unknown Drift instruction"};
        std::cout << "  ix " << instruction.index << ": " << label << " (" << instruction.data_len << " bytes)\n";
    }
}

static void write_json(const std::filesystem::path& path, const nlohmann::json& json) {
    std::ofstream file{path};
    if (!file) {
        throw std::runtime_error{"cannot create " + path.string()};
    }
    file << json.dump(2) << "\n";
}

int main(int argc, char* argv[]) {
    absl::SetProgramUsageMessage("Decode Drift instructions of the given transaction signatures into JSON dumps");
    const auto positional = absl::ParseCommandLine(argc, argv);

    DRIFTGATE_LOG_VERBOSITY(absl::GetFlag(FLAGS_logLevel));

    const auto rpc_url = driftgate::value_or_env(absl::GetFlag(FLAGS_rpc_url), driftgate::kRpcUrlEnv, driftgate::kDefaultRpcUrl);
    const auto program = driftgate::value_or_env(absl::GetFlag(FLAGS_program_id), driftgate::kDriftProgramEnv, driftgate::kDefaultDriftProgram);
    const auto program_id = driftgate::PublicKey::from_base58(program);
    if (!program_id) {
        DRIFTGATE_ERROR << "Parameter program_id is invalid: [" << program << "]\n";
        DRIFTGATE_ERROR << "Use --program_id flag or DRIFT_PROGRAM_ID to specify the Drift program id in base58\n";
        return -1;
    }

    std::vector<std::string> signatures(positional.begin() + 1, positional.end());
    if (signatures.empty()) {
        signatures = kSampleSignatures;
    }

    try {
        const std::filesystem::path dump_root{absl::GetFlag(FLAGS_dump_dir)};
        std::filesystem::create_directories(dump_root);

        driftgate::concurrency::ContextPool context_pool{1};
        context_pool.start();

        driftgate::rpc::JsonRpcClient client{driftgate::rpc::RpcClientSettings{rpc_url}};
        driftgate::decoding::Decoder decoder{client, driftgate::decoding::DecoderSettings{*program_id}};
        std::cout << "Using RPC " << rpc_url << " and Drift program " << *program_id << "\n\n";

        nlohmann::json action_table = nlohmann::json::array();
        for (const auto& signature : signatures) {
            std::cout << "=========================\n";
            std::cout << "Signature: " << signature << "\n";
            try {
                auto result = boost::asio::co_spawn(context_pool.next_io_context(), decoder.decode_signature(signature), boost::asio::use_future);
                const auto decoded = result.get();
                print_summary(decoded.dump);
                const auto path = dump_root / (signature + ".json");
                write_json(path, decoded.dump);
                std::cout << "  wrote " << path.string() << "\n";
                for (const auto& action : decoded.actions) {
                    action_table.push_back(action);
                }
            } catch (const std::exception& e) {
                std::cerr << "  !! failed to decode " << signature << ": " << e.what() << "\n";
            }
        }

        if (!action_table.empty()) {
            const auto aggregated_path = dump_root / "aggregated-actions.json";
            write_json(aggregated_path, action_table);
            std::cout << "\nWrote aggregated actions to " << aggregated_path.string() << "\n";
        }

        context_pool.stop();
        context_pool.join();
    } catch (const std::exception& e) {
        DRIFTGATE_CRIT << "Exception: " << e.what() << "\n" << std::flush;
        return -1;
    }

    return 0;
}
