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

#include "error.hpp"

#include <utility>

namespace driftgate::execution {

namespace {

struct ExecutorErrorCategory : std::error_category {
    const char* name() const noexcept override { return "executor"; }

    std::string message(int ev) const override {
        switch (static_cast<ExecutorErrc>(ev)) {
            case ExecutorErrc::missing_key:
                return "missing server private key";
            case ExecutorErrc::invalid_key:
                return "invalid private key";
            case ExecutorErrc::decode:
                return "decode error";
            case ExecutorErrc::rpc:
                return "rpc error";
        }
        return "unknown executor error";
    }
};

const ExecutorErrorCategory executor_error_category{};

} // namespace

std::error_code make_error_code(ExecutorErrc errc) {
    return {static_cast<int>(errc), executor_error_category};
}

ExecutorError::ExecutorError(ExecutorErrc errc, std::string detail)
    : std::system_error{make_error_code(errc)}, detail_{std::move(detail)}, message_{code().message()} {
    if (!detail_.empty()) {
        message_ += ": " + detail_;
    }
}

} // namespace driftgate::execution
