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
#include <driftgate/indexing/backfill.hpp>
#include <driftgate/json/types.hpp>
#include <driftgate/rpc/json_rpc_client.hpp>
#include <driftgate/storage/memory_action_store.hpp>

ABSL_FLAG(std::string, wallet, "", "wallet address whose signatures are backfilled (base58)");
ABSL_FLAG(uint32_t, limit, driftgate::kDefaultBackfillLimit, "maximum number of signatures to fetch");
ABSL_FLAG(std::string, output, "backfill-actions.json", "file receiving the stored action records");
ABSL_FLAG(std::string, rpc_url, "", "Solana JSON-RPC endpoint, falls back to RPC_URL");
ABSL_FLAG(std::string, program_id, "", "Drift program id, falls back to DRIFT_PROGRAM_ID");
ABSL_FLAG(driftgate::LogLevel, logLevel, driftgate::LogLevel::Info, "logging level");

using driftgate::indexing::BackfillReport;

static boost::asio::awaitable<BackfillReport> run(driftgate::rpc::JsonRpcClient& client, const driftgate::decoding::Decoder& decoder,
                                                  driftgate::storage::ActionStore& store, std::string wallet, std::size_t limit) {
    const auto signatures = co_await driftgate::indexing::fetch_signatures(client, wallet, limit);
    DRIFTGATE_INFO << "Fetched " << signatures.size() << " signatures for " << wallet << "\n";
    co_return co_await driftgate::indexing::backfill(decoder, store, signatures);
}

int main(int argc, char* argv[]) {
    absl::SetProgramUsageMessage("Backfill Drift actions of one wallet into the action store");
    absl::ParseCommandLine(argc, argv);

    DRIFTGATE_LOG_VERBOSITY(absl::GetFlag(FLAGS_logLevel));

    const auto wallet = absl::GetFlag(FLAGS_wallet);
    if (!driftgate::PublicKey::from_base58(wallet)) {
        DRIFTGATE_ERROR << "Parameter wallet is invalid: [" << wallet << "]\n";
        DRIFTGATE_ERROR << "Use --wallet flag to specify the wallet address in base58\n";
        return -1;
    }
    const auto limit = absl::GetFlag(FLAGS_limit);
    if (limit == 0) {
        DRIFTGATE_ERROR << "Parameter limit is invalid: [" << limit << "]\n";
        DRIFTGATE_ERROR << "Use --limit flag to specify a positive number of signatures\n";
        return -1;
    }
    const auto program = driftgate::value_or_env(absl::GetFlag(FLAGS_program_id), driftgate::kDriftProgramEnv, driftgate::kDefaultDriftProgram);
    const auto program_id = driftgate::PublicKey::from_base58(program);
    if (!program_id) {
        DRIFTGATE_ERROR << "Parameter program_id is invalid: [" << program << "]\n";
        DRIFTGATE_ERROR << "Use --program_id flag or DRIFT_PROGRAM_ID to specify the Drift program id in base58\n";
        return -1;
    }
    const auto rpc_url = driftgate::value_or_env(absl::GetFlag(FLAGS_rpc_url), driftgate::kRpcUrlEnv, driftgate::kDefaultRpcUrl);

    try {
        driftgate::concurrency::ContextPool context_pool{1};
        context_pool.start();

        driftgate::rpc::JsonRpcClient client{driftgate::rpc::RpcClientSettings{rpc_url}};
        driftgate::decoding::Decoder decoder{client, driftgate::decoding::DecoderSettings{*program_id}};
        driftgate::storage::MemoryActionStore store;

        DRIFTGATE_LOG << "Backfilling " << wallet << " via " << rpc_url << " (limit " << limit << ")\n";
        auto result = boost::asio::co_spawn(context_pool.next_io_context(), run(client, decoder, store, wallet, limit),
                                            boost::asio::use_future);
        const auto report = result.get();

        auto stored = boost::asio::co_spawn(context_pool.next_io_context(), store.fetch_actions(store.size()),
                                            boost::asio::use_future);
        const nlohmann::json actions = stored.get();
        std::ofstream output{absl::GetFlag(FLAGS_output)};
        if (!output) {
            throw std::runtime_error{"cannot create " + absl::GetFlag(FLAGS_output)};
        }
        output << actions.dump(2) << "\n";

        DRIFTGATE_LOG << "Done. Decoded " << report.decoded << " signatures, " << report.failed << " failed, inserted "
                      << report.rows << " rows into " << absl::GetFlag(FLAGS_output) << "\n";

        context_pool.stop();
        context_pool.join();
    } catch (const std::exception& e) {
        DRIFTGATE_CRIT << "Exception: " << e.what() << "\n" << std::flush;
        return -1;
    }

    return 0;
}
