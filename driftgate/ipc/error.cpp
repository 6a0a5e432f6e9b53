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

namespace driftgate::ipc {

namespace {

struct IpcErrorCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
};

const char* IpcErrorCategory::name() const noexcept { return "ipc"; }

std::string IpcErrorCategory::message(int ev) const {
    switch (static_cast<IpcErrc>(ev)) {
        case IpcErrc::timeout:
            return "ipc timeout";
        case IpcErrc::worker_crashed:
            return "worker crashed";
        case IpcErrc::protocol:
            return "ipc protocol error";
        case IpcErrc::remote:
            return "worker returned error";
        case IpcErrc::spawn:
            return "failed to spawn worker";
        case IpcErrc::write:
            return "ipc write error";
    }
    return "unknown ipc error";
}

const IpcErrorCategory ipc_error_category{};

} // namespace

std::error_code make_error_code(IpcErrc errc) {
    return {static_cast<int>(errc), ipc_error_category};
}

IpcError::IpcError(IpcErrc errc, std::string detail)
    : std::system_error{make_error_code(errc)}, detail_{std::move(detail)} {
    message_ = code().message();
    if (!detail_.empty()) {
        message_ += ": " + detail_;
    }
}

} // namespace driftgate::ipc
