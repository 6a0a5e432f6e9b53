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

#ifndef DRIFTGATE_IPC_PROCESS_BRIDGE_HPP_
#define DRIFTGATE_IPC_PROCESS_BRIDGE_HPP_

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <driftgate/common/constants.hpp>
#include <driftgate/ipc/bridge.hpp>

namespace driftgate::ipc {

struct WorkerSettings {
    std::string program{kDefaultNodePath};
    std::vector<std::string> args{kNodeSourceMapsOption, kDefaultWorkerPath};
};

//! Default launch line: node --enable-source-maps <worker_path>
WorkerSettings make_node_worker_settings(const std::string& node_path, const std::string& worker_path);

enum class WorkerState {
    kNoWorker,
    kStarting,
    kReady,
    kCrashed,
};

std::ostream& operator<<(std::ostream& out, WorkerState state);

//! WorkerBridge over one long-lived subprocess speaking newline-delimited JSON on stdin/stdout.
//! Worker stderr is inherited. All pipe I/O runs on a strand of the given io_context.
//! Writes to an exited worker raise SIGPIPE: the hosting process must ignore it.
//! The worker and the pending calls live in shared state that calls in flight keep alive,
//! so the bridge may be destroyed before its io_context has drained them.
class ProcessBridge : public WorkerBridge {
  public:
    ProcessBridge(boost::asio::io_context& io_context, WorkerSettings settings);
    ~ProcessBridge() override;

    //! Spawn the worker now instead of on the first call. Throws IpcError(spawn), or IpcError(worker_crashed) after shutdown.
    void connect();

    boost::asio::awaitable<nlohmann::json> submit(std::string function, nlohmann::json args, std::chrono::milliseconds timeout) override;

    //! Kill the worker and fail every pending call with worker_crashed. Later calls fail the same way without spawning.
    void shutdown();

    WorkerState state() const;
    std::size_t spawn_count() const noexcept;
    std::size_t pending_count() const;

  private:
    class Impl;

    std::shared_ptr<Impl> impl_;
};

} // namespace driftgate::ipc

#endif // DRIFTGATE_IPC_PROCESS_BRIDGE_HPP_
