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

#ifndef DRIFTGATE_EXECUTION_ERROR_HPP_
#define DRIFTGATE_EXECUTION_ERROR_HPP_

#include <string>
#include <system_error>

namespace driftgate::execution {

enum class ExecutorErrc {
    // value 0 reserved for no error
    missing_key = 1,
    invalid_key,
    decode,
    rpc,
};

std::error_code make_error_code(ExecutorErrc errc);

class ExecutorError : public std::system_error {
  public:
    explicit ExecutorError(ExecutorErrc errc, std::string detail = {});

    ExecutorErrc errc() const noexcept { return static_cast<ExecutorErrc>(code().value()); }
    const std::string& detail() const noexcept { return detail_; }

    const char* what() const noexcept override { return message_.c_str(); }

  private:
    std::string detail_;
    std::string message_;
};

} // namespace driftgate::execution

namespace std {

template<>
struct is_error_code_enum<driftgate::execution::ExecutorErrc> : true_type {};

} // namespace std

#endif // DRIFTGATE_EXECUTION_ERROR_HPP_
