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

#include "backfill.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <optional>
#include <set>

#include <driftgate/common/constants.hpp>
#include <driftgate/common/log.hpp>

namespace driftgate::indexing {

boost::asio::awaitable<std::vector<std::string>> fetch_signatures(rpc::SignatureSource& source, std::string address, std::size_t max) {
    std::vector<std::string> signatures;
    std::set<std::string> seen;
    std::optional<std::string> before;

    while (signatures.size() < max) {
        const auto remaining = std::min(max - signatures.size(), kMaxSignaturesPerPage);
        const auto batch = co_await source.get_signatures_for_address(address, before, remaining);
        if (batch.empty()) {
            break;
        }
        DRIFTGATE_DEBUG << "fetch_signatures page of " << batch.size() << " before: " << before.value_or("<latest>") << "\n";
        before = batch.back().signature;
        for (const auto& info : batch) {
            if (seen.insert(info.signature).second) {
                signatures.push_back(info.signature);
                if (signatures.size() >= max) {
                    break;
                }
            }
        }
    }
    co_return signatures;
}

boost::asio::awaitable<BackfillReport> backfill(const decoding::Decoder& decoder, storage::ActionStore& store,
                                                std::vector<std::string> signatures) {
    BackfillReport report;
    for (const auto& signature : signatures) {
        decoding::DecodeResult result;
        try {
            result = co_await decoder.decode_signature(signature);
        } catch (const std::exception& e) {
            DRIFTGATE_ERROR << signature << ": decode failed: " << e.what() << "\n";
            ++report.failed;
            continue;
        }
        ++report.decoded;
        if (result.actions.empty()) {
            continue;
        }

        try {
            const auto rows = co_await store.insert_actions(result.actions);
            report.rows += rows;
            DRIFTGATE_INFO << signature << ": inserted " << rows << " rows\n";
        } catch (const std::exception& e) {
            DRIFTGATE_ERROR << signature << ": store insert failed: " << e.what() << "\n";
            ++report.failed;
            continue;
        }
        std::move(result.actions.begin(), result.actions.end(), std::back_inserter(report.actions));
    }
    co_return report;
}

} // namespace driftgate::indexing
