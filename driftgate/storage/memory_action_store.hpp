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

#ifndef DRIFTGATE_STORAGE_MEMORY_ACTION_STORE_HPP_
#define DRIFTGATE_STORAGE_MEMORY_ACTION_STORE_HPP_

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <driftgate/storage/action_store.hpp>

namespace driftgate::storage {

class MemoryActionStore : public ActionStore {
  public:
    MemoryActionStore() = default;

    boost::asio::awaitable<uint64_t> insert_actions(std::vector<ActionRecord> records) override;
    boost::asio::awaitable<std::vector<ActionRecord>> fetch_actions(std::size_t limit) override;

    std::size_t size() const;

  private:
    using Key = std::pair<std::string, std::size_t>;

    mutable std::mutex mutex_;
    std::map<Key, ActionRecord> records_;
};

} // namespace driftgate::storage

#endif // DRIFTGATE_STORAGE_MEMORY_ACTION_STORE_HPP_
