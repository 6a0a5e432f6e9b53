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

#ifndef DRIFTGATE_STORAGE_ACTION_STORE_HPP_
#define DRIFTGATE_STORAGE_ACTION_STORE_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>

#include <driftgate/types/action.hpp>

namespace driftgate::storage {

//! Durable sink for decoded actions, keyed by (signature, instruction_index).
class ActionStore {
  public:
    ActionStore() = default;
    virtual ~ActionStore() = default;

    ActionStore(const ActionStore&) = delete;
    ActionStore& operator=(const ActionStore&) = delete;

    //! Upsert the records, returning how many rows were written
    virtual boost::asio::awaitable<uint64_t> insert_actions(std::vector<ActionRecord> records) = 0;

    //! Most recent records first, by slot
    virtual boost::asio::awaitable<std::vector<ActionRecord>> fetch_actions(std::size_t limit) = 0;
};

} // namespace driftgate::storage

#endif // DRIFTGATE_STORAGE_ACTION_STORE_HPP_
