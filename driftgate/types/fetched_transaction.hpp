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

#ifndef DRIFTGATE_TYPES_FETCHED_TRANSACTION_HPP_
#define DRIFTGATE_TYPES_FETCHED_TRANSACTION_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <driftgate/common/base.hpp>

namespace driftgate {

struct TokenBalance {
    std::size_t account_index{0};
    std::string mint;
};

struct TransactionMeta {
    /* JSON text of the execution error, empty on success */
    std::optional<std::string> err;
    std::vector<TokenBalance> pre_token_balances;
    std::vector<TokenBalance> post_token_balances;
    std::vector<std::string> loaded_writable;
    std::vector<std::string> loaded_readonly;
};

//! A confirmed transaction as returned by getTransaction with base64 encoding.
struct FetchedTransaction {
    uint64_t slot{0};
    std::optional<int64_t> block_time;
    Bytes transaction;
    std::optional<TransactionMeta> meta;
};

} // namespace driftgate

#endif // DRIFTGATE_TYPES_FETCHED_TRANSACTION_HPP_
