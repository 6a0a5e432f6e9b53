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
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

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
#include <driftgate/execution/key_loader.hpp>
#include <driftgate/execution/tx_executor.hpp>
#include <driftgate/gateway.hpp>
#include <driftgate/ipc/process_bridge.hpp>
#include <driftgate/rpc/json_rpc_client.hpp>

ABSL_FLAG(std::string, fn, "", "worker function to call");
ABSL_FLAG(std::string, args, "{}", "worker function arguments as JSON object");
ABSL_FLAG(bool, execute, false, "sign and submit the txBase64 returned by the worker with the server key");
ABSL_FLAG(uint32_t, timeout, driftgate::kDefaultWorkerTimeout.count(), "worker call timeout in milliseconds as 32-bit integer");
ABSL_FLAG(std::string, node_path, "", "Node.js executable, falls back to TS_NODE_PATH");
ABSL_FLAG(std::string, worker_path, "", "compiled worker script, falls back to TS_WORKER_PATH");
ABSL_FLAG(std::string, rpc_url, "", "Solana JSON-RPC endpoint, falls back to RPC_URL");
ABSL_FLAG(bool, skip_preflight, false, "submit without preflight simulation");
ABSL_FLAG(driftgate::LogLevel, logLevel, driftgate::LogLevel::Warn, "logging level");

static std::optional<std::string> server_private_key() {
    const char* key = std::getenv(driftgate::kServerPrivateKeyEnv);
    if (key == nullptr) {
        return std::nullopt;
    }
    return std::string{key};
}

int main(int argc, char* argv[]) {
    absl::SetProgramUsageMessage("Call one worker function and optionally execute the returned transaction");
    absl::ParseCommandLine(argc, argv);

    DRIFTGATE_LOG_VERBOSITY(absl::GetFlag(FLAGS_logLevel));
    DRIFTGATE_LOG_THREAD(true);

    // Writing to an exited worker must fail with EPIPE, not terminate this process
    std::signal(SIGPIPE, SIG_IGN);

    const auto function = absl::GetFlag(FLAGS_fn);
    if (function.empty()) {
        DRIFTGATE_ERROR << "Parameter fn is invalid: [" << function << "]\n";
        DRIFTGATE_ERROR << "Use --fn flag to specify the worker function to call\n";
        return -1;
    }
    const auto args_text = absl::GetFlag(FLAGS_args);
    const auto args = nlohmann::json::parse(args_text, nullptr, /*allow_exceptions=*/false);
    if (!args.is_object()) {
        DRIFTGATE_ERROR << "Parameter args is invalid: [" << args_text << "]\n";
        DRIFTGATE_ERROR << "Use --args flag to specify the function arguments as JSON object\n";
        return -1;
    }
    const auto timeout = std::chrono::milliseconds{absl::GetFlag(FLAGS_timeout)};
    if (timeout.count() == 0) {
        DRIFTGATE_ERROR << "Parameter timeout is invalid: [" << timeout.count() << "]\n";
        DRIFTGATE_ERROR << "Use --timeout flag to specify a positive call timeout in milliseconds\n";
        return -1;
    }

    const auto node_path = driftgate::value_or_env(absl::GetFlag(FLAGS_node_path), driftgate::kNodePathEnv, driftgate::kDefaultNodePath);
    const auto worker_path = driftgate::value_or_env(absl::GetFlag(FLAGS_worker_path), driftgate::kWorkerPathEnv, driftgate::kDefaultWorkerPath);
    const auto rpc_url = driftgate::value_or_env(absl::GetFlag(FLAGS_rpc_url), driftgate::kRpcUrlEnv, driftgate::kDefaultRpcUrl);

    try {
        driftgate::concurrency::ContextPool context_pool{1};
        context_pool.start();
        auto& io_context = context_pool.next_io_context();

        driftgate::ipc::ProcessBridge bridge{io_context, driftgate::ipc::make_node_worker_settings(node_path, worker_path)};
        DRIFTGATE_INFO << "Worker: " << node_path << " " << worker_path << "\n";

        nlohmann::json result;
        if (absl::GetFlag(FLAGS_execute)) {
            driftgate::rpc::JsonRpcClient client{driftgate::rpc::RpcClientSettings{rpc_url}};
            driftgate::execution::ExecutorSettings settings;
            settings.skip_preflight = absl::GetFlag(FLAGS_skip_preflight);
            driftgate::execution::TxExecutor executor{client, driftgate::execution::load_server_keypair(server_private_key()), settings};
            DRIFTGATE_INFO << "Server key: " << executor.public_key_base58() << " RPC: " << rpc_url << "\n";

            driftgate::Gateway gateway{bridge, executor, timeout};
            auto call = boost::asio::co_spawn(io_context, gateway.build_and_execute(function, args), boost::asio::use_future);
            result = call.get();
        } else {
            auto call = boost::asio::co_spawn(io_context, bridge.submit(function, args, timeout), boost::asio::use_future);
            result = call.get();
        }
        std::cout << result.dump(2) << "\n";

        bridge.shutdown();
        context_pool.stop();
        context_pool.join();
    } catch (const std::exception& e) {
        DRIFTGATE_CRIT << "Exception: " << e.what() << "\n" << std::flush;
        return -1;
    }

    return 0;
}
