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

#ifndef DRIFTGATE_RPC_ERROR_HPP_
#define DRIFTGATE_RPC_ERROR_HPP_

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace driftgate::rpc {

//! Failure talking to the blockchain node: transport, HTTP status or JSON-RPC error object.
class RpcError : public std::runtime_error {
  public:
    explicit RpcError(const std::string& what, std::optional<int64_t> code = std::nullopt, bool preflight = false)
        : std::runtime_error{what}, code_{code}, preflight_{preflight} {}

    const std::optional<int64_t>& code() const noexcept { return code_; }

    //! True when the node rejected the transaction during simulation before broadcasting it
    bool is_preflight_failure() const noexcept { return preflight_; }

  private:
    std::optional<int64_t> code_;
    bool preflight_;
};

} // namespace driftgate::rpc

#endif // DRIFTGATE_RPC_ERROR_HPP_
