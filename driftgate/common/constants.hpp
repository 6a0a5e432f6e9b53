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

#ifndef DRIFTGATE_COMMON_CONSTANTS_HPP_
#define DRIFTGATE_COMMON_CONSTANTS_HPP_

#include <chrono>
#include <cstddef>

namespace driftgate {

constexpr const char* kDefaultDriftProgram{"dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH"};
constexpr const char* kDefaultRpcUrl{"https://api.devnet.solana.com"};

constexpr const char* kDefaultNodePath{"node"};
constexpr const char* kDefaultWorkerPath{"../ts-worker/dist/index.js"};
constexpr const char* kNodeSourceMapsOption{"--enable-source-maps"};

constexpr const char* kRpcUrlEnv{"RPC_URL"};
constexpr const char* kDriftProgramEnv{"DRIFT_PROGRAM_ID"};
constexpr const char* kServerPrivateKeyEnv{"SERVER_PRIVATE_KEY"};
constexpr const char* kNodePathEnv{"TS_NODE_PATH"};
constexpr const char* kWorkerPathEnv{"TS_WORKER_PATH"};

constexpr const char* kCommitmentConfirmed{"confirmed"};
constexpr const char* kCommitmentFinalized{"finalized"};

constexpr const char* kTxBase64Field{"txBase64"};
constexpr const char* kTxSignatureField{"txSignature"};

constexpr const std::chrono::milliseconds kDefaultWorkerTimeout{10'000};
constexpr const std::chrono::milliseconds kDefaultQueryTimeout{5'000};
constexpr const std::chrono::milliseconds kDefaultRpcTimeout{30'000};
constexpr const std::chrono::milliseconds kDefaultConfirmTimeout{60'000};
constexpr const std::chrono::milliseconds kDefaultConfirmPollInterval{500};

constexpr const std::size_t kMaxSignaturesPerPage{1000};
constexpr const std::size_t kDefaultBackfillLimit{1000};

constexpr const std::size_t kWorkerLineInitialCapacity{4096};

} // namespace driftgate

#endif  // DRIFTGATE_COMMON_CONSTANTS_HPP_
