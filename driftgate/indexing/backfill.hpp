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

#ifndef DRIFTGATE_INDEXING_BACKFILL_HPP_
#define DRIFTGATE_INDEXING_BACKFILL_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>

#include <driftgate/decoding/decoder.hpp>
#include <driftgate/rpc/interfaces.hpp>
#include <driftgate/storage/action_store.hpp>
#include <driftgate/types/action.hpp>

namespace driftgate::indexing {

//! Up to \p max distinct signatures for the address, newest first, paging backwards from the most recent.
boost::asio::awaitable<std::vector<std::string>> fetch_signatures(rpc::SignatureSource& source, std::string address, std::size_t max);

struct BackfillReport {
    std::size_t decoded{0};
    std::size_t failed{0};
    uint64_t rows{0};
    std::vector<ActionRecord> actions;
};

//! Decode each signature and upsert its actions. Failures are logged and counted, never fatal.
boost::asio::awaitable<BackfillReport> backfill(const decoding::Decoder& decoder, storage::ActionStore& store,
                                                std::vector<std::string> signatures);

} // namespace driftgate::indexing

#endif // DRIFTGATE_INDEXING_BACKFILL_HPP_
