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

#include "memory_action_store.hpp"

#include <algorithm>

namespace driftgate::storage {

boost::asio::awaitable<uint64_t> MemoryActionStore::insert_actions(std::vector<ActionRecord> records) {
    std::scoped_lock lock{mutex_};
    uint64_t written{0};
    for (auto& record : records) {
        Key key{record.signature, record.instruction_index};
        records_.insert_or_assign(std::move(key), std::move(record));
        ++written;
    }
    co_return written;
}

boost::asio::awaitable<std::vector<ActionRecord>> MemoryActionStore::fetch_actions(std::size_t limit) {
    std::vector<ActionRecord> records;
    {
        std::scoped_lock lock{mutex_};
        records.reserve(records_.size());
        for (const auto& [key, record] : records_) {
            records.push_back(record);
        }
    }
    std::stable_sort(records.begin(), records.end(), [](const auto& lhs, const auto& rhs) { return lhs.slot > rhs.slot; });
    if (records.size() > limit) {
        records.resize(limit);
    }
    co_return records;
}

std::size_t MemoryActionStore::size() const {
    std::scoped_lock lock{mutex_};
    return records_.size();
}

} // namespace driftgate::storage
