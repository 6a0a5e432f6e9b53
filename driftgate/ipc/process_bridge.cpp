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

#include "process_bridge.hpp"

#include <atomic>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

#include <driftgate/common/log.hpp>
#include <driftgate/common/util.hpp>
#include <driftgate/concurrency/async_mutex.hpp>
#include <driftgate/ipc/error.hpp>
#include <driftgate/ipc/protocol.hpp>

namespace driftgate::ipc {

WorkerSettings make_node_worker_settings(const std::string& node_path, const std::string& worker_path) {
    return WorkerSettings{node_path, {kNodeSourceMapsOption, worker_path}};
}

std::ostream& operator<<(std::ostream& out, WorkerState state) {
    switch (state) {
        case WorkerState::kNoWorker: out << "no-worker"; break;
        case WorkerState::kStarting: out << "starting"; break;
        case WorkerState::kReady: out << "ready"; break;
        case WorkerState::kCrashed: out << "crashed"; break;
    }
    return out;
}

class ProcessBridge::Impl : public std::enable_shared_from_this<ProcessBridge::Impl> {
  public:
    Impl(boost::asio::io_context& io_context, WorkerSettings settings)
        : io_context_(io_context), strand_{boost::asio::make_strand(io_context)}, settings_{std::move(settings)} {}

    const boost::asio::strand<boost::asio::io_context::executor_type>& strand() const noexcept { return strand_; }

    boost::asio::awaitable<nlohmann::json> call_with_retry(std::string function, nlohmann::json args, std::chrono::milliseconds timeout);

    void connect() { ensure_worker(); }
    void shutdown();

    WorkerState state() const;
    std::size_t spawn_count() const noexcept { return spawn_count_; }
    std::size_t pending_count() const;

  private:
    struct Worker {
        explicit Worker(boost::asio::io_context& io_context) : stdin_pipe{io_context}, stdout_pipe{io_context} {}

        boost::process::async_pipe stdin_pipe;
        boost::process::async_pipe stdout_pipe;
        boost::process::child child;
        concurrency::AsyncMutex write_mutex;
        std::atomic_bool closed{false};
    };

    struct PendingCall {
        template<typename Executor>
        PendingCall(const Executor& executor, std::chrono::milliseconds timeout) : timer{executor, timeout} {}

        boost::asio::steady_timer timer;
        bool completed{false};
        std::optional<nlohmann::json> result;
        std::exception_ptr error;
    };

    using PendingTable = std::map<std::string, std::shared_ptr<PendingCall>>;

    boost::asio::awaitable<nlohmann::json> call_once(const std::string& function, const nlohmann::json& args,
        std::chrono::milliseconds timeout, std::shared_ptr<Worker>& used_worker);
    boost::asio::awaitable<void> read_loop(std::shared_ptr<Worker> worker);

    std::shared_ptr<Worker> ensure_worker();
    std::shared_ptr<Worker> spawn_worker();
    void handle_line(const std::string& line);
    void handle_worker_failure(const std::shared_ptr<Worker>& worker);
    void teardown(const std::shared_ptr<Worker>& worker);

    void register_pending(const std::string& id, std::shared_ptr<PendingCall> call);
    std::shared_ptr<PendingCall> take_pending(const std::string& id);
    PendingTable take_all_pending();
    void fail_pending(PendingTable table);

    boost::asio::io_context& io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    WorkerSettings settings_;

    mutable std::mutex worker_mutex_;
    std::shared_ptr<Worker> worker_;
    WorkerState state_{WorkerState::kNoWorker};
    std::atomic<std::size_t> spawn_count_{0};
    std::atomic_bool shut_down_{false};

    mutable std::mutex pending_mutex_;
    PendingTable pending_;
};

ProcessBridge::ProcessBridge(boost::asio::io_context& io_context, WorkerSettings settings)
    : impl_{std::make_shared<Impl>(io_context, std::move(settings))} {}

ProcessBridge::~ProcessBridge() {
    impl_->shutdown();
}

void ProcessBridge::connect() {
    impl_->connect();
}

boost::asio::awaitable<nlohmann::json> ProcessBridge::submit(std::string function, nlohmann::json args, std::chrono::milliseconds timeout) {
    // the call holds its own reference to the state until it completes
    auto impl = impl_;
    co_return co_await boost::asio::co_spawn(impl->strand(),
        impl->call_with_retry(std::move(function), std::move(args), timeout), boost::asio::use_awaitable);
}

void ProcessBridge::shutdown() {
    impl_->shutdown();
}

WorkerState ProcessBridge::state() const {
    return impl_->state();
}

std::size_t ProcessBridge::spawn_count() const noexcept {
    return impl_->spawn_count();
}

std::size_t ProcessBridge::pending_count() const {
    return impl_->pending_count();
}

void ProcessBridge::Impl::shutdown() {
    std::shared_ptr<Worker> worker;
    PendingTable pending;
    {
        std::scoped_lock lock{worker_mutex_};
        shut_down_ = true;
        worker = std::exchange(worker_, nullptr);
        state_ = WorkerState::kNoWorker;
        pending = take_all_pending();
    }
    if (worker) {
        DRIFTGATE_INFO << "ProcessBridge::shutdown killing worker pid: " << worker->child.id() << "\n";
        teardown(worker);
    }
    fail_pending(std::move(pending));
}

WorkerState ProcessBridge::Impl::state() const {
    std::scoped_lock lock{worker_mutex_};
    return state_;
}

std::size_t ProcessBridge::Impl::pending_count() const {
    std::scoped_lock lock{pending_mutex_};
    return pending_.size();
}

boost::asio::awaitable<nlohmann::json> ProcessBridge::Impl::call_with_retry(std::string function, nlohmann::json args, std::chrono::milliseconds timeout) {
    std::shared_ptr<Worker> worker;
    try {
        co_return co_await call_once(function, args, timeout, worker);
    } catch (const IpcError& e) {
        if ((e.errc() != IpcErrc::worker_crashed && e.errc() != IpcErrc::write) || shut_down_) {
            throw;
        }
        DRIFTGATE_WARN << "ProcessBridge: " << function << " failed: " << e.what() << ", respawning worker and retrying\n";
    }
    if (worker) {
        handle_worker_failure(worker);
    }
    co_return co_await call_once(function, args, timeout, worker);
}

boost::asio::awaitable<nlohmann::json> ProcessBridge::Impl::call_once(const std::string& function, const nlohmann::json& args,
        std::chrono::milliseconds timeout, std::shared_ptr<Worker>& used_worker) {
    used_worker = ensure_worker();

    const auto id = make_correlation_id();
    const auto request = encode_request(id, function, args);
    auto call = std::make_shared<PendingCall>(strand_, timeout);
    register_pending(id, call);
    DRIFTGATE_DEBUG << "ProcessBridge::call_once id: " << id << " fn: " << function << "\n";

    boost::system::error_code write_ec;
    {
        auto guard = co_await concurrency::scoped_lock(used_worker->write_mutex);
        co_await boost::asio::async_write(used_worker->stdin_pipe, boost::asio::buffer(request),
            boost::asio::redirect_error(boost::asio::use_awaitable, write_ec));
    }
    if (write_ec && !call->completed) {
        take_pending(id);
        throw IpcError{IpcErrc::write, write_ec.message()};
    }

    if (!call->completed) {
        boost::system::error_code timer_ec;
        co_await call->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, timer_ec));
    }
    if (!call->completed) {
        take_pending(id);
        DRIFTGATE_WARN << "ProcessBridge: " << function << " id: " << id << " timed out after " << timeout.count() << " ms\n";
        throw IpcError{IpcErrc::timeout, function + " after " + std::to_string(timeout.count()) + " ms"};
    }
    if (call->error) {
        std::rethrow_exception(call->error);
    }
    co_return std::move(*call->result);
}

boost::asio::awaitable<void> ProcessBridge::Impl::read_loop(std::shared_ptr<Worker> worker) {
    std::string buffer;
    buffer.reserve(kWorkerLineInitialCapacity);
    boost::system::error_code ec;
    while (!worker->closed) {
        const auto length = co_await boost::asio::async_read_until(worker->stdout_pipe, boost::asio::dynamic_buffer(buffer), '\n',
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || worker->closed) {
            break;
        }
        const std::string line = buffer.substr(0, length - 1);
        buffer.erase(0, length);
        if (!trim(line).empty()) {
            handle_line(line);
        }
    }
    // A closed worker was torn down on purpose and nothing else may be touched
    if (worker->closed) {
        co_return;
    }
    DRIFTGATE_WARN << "ProcessBridge: worker stdout closed: " << ec.message() << "\n";
    handle_worker_failure(worker);
}

std::shared_ptr<ProcessBridge::Impl::Worker> ProcessBridge::Impl::ensure_worker() {
    std::shared_ptr<Worker> worker;
    {
        std::scoped_lock lock{worker_mutex_};
        if (shut_down_) {
            throw IpcError{IpcErrc::worker_crashed, "bridge shut down"};
        }
        if (worker_) {
            return worker_;
        }
        state_ = WorkerState::kStarting;
        try {
            worker = spawn_worker();
        } catch (const IpcError& e) {
            state_ = WorkerState::kNoWorker;
            DRIFTGATE_ERROR << "ProcessBridge: " << e.what() << "\n";
            throw;
        }
        worker_ = worker;
        state_ = WorkerState::kReady;
    }
    ++spawn_count_;
    DRIFTGATE_INFO << "ProcessBridge: worker started pid: " << worker->child.id() << " spawn count: " << spawn_count_ << "\n";

    boost::asio::co_spawn(strand_, read_loop(worker), [self = shared_from_this()](std::exception_ptr eptr) {
        if (eptr) std::rethrow_exception(eptr);
    });
    return worker;
}

std::shared_ptr<ProcessBridge::Impl::Worker> ProcessBridge::Impl::spawn_worker() {
    boost::filesystem::path program{settings_.program};
    if (!program.has_parent_path()) {
        program = boost::process::search_path(settings_.program);
    }
    if (program.empty()) {
        throw IpcError{IpcErrc::spawn, "program not found: " + settings_.program};
    }

    auto worker = std::make_shared<Worker>(io_context_);
    std::error_code ec;
    worker->child = boost::process::child{
        boost::process::exe = program,
        boost::process::args = settings_.args,
        boost::process::std_in < worker->stdin_pipe,
        boost::process::std_out > worker->stdout_pipe,
        ec};
    if (ec) {
        throw IpcError{IpcErrc::spawn, program.string() + ": " + ec.message()};
    }
    return worker;
}

void ProcessBridge::Impl::handle_line(const std::string& line) {
    WorkerResponse response;
    try {
        response = parse_response(line);
    } catch (const IpcError& e) {
        DRIFTGATE_WARN << "ProcessBridge: skipping worker line: " << e.what() << "\n";
        return;
    }

    auto call = take_pending(response.id);
    if (!call) {
        DRIFTGATE_WARN << "ProcessBridge: no pending call for response id: " << response.id << "\n";
        return;
    }
    try {
        call->result = unwrap_response(std::move(response));
    } catch (const IpcError&) {
        call->error = std::current_exception();
    }
    call->completed = true;
    call->timer.cancel();
}

void ProcessBridge::Impl::handle_worker_failure(const std::shared_ptr<Worker>& worker) {
    PendingTable pending;
    {
        std::scoped_lock lock{worker_mutex_};
        if (worker_ != worker) {
            return;
        }
        worker_.reset();
        state_ = WorkerState::kCrashed;
        pending = take_all_pending();
    }
    DRIFTGATE_ERROR << "ProcessBridge: worker pid: " << worker->child.id() << " crashed, failing " << pending.size() << " pending calls\n";
    teardown(worker);
    fail_pending(std::move(pending));
}

void ProcessBridge::Impl::teardown(const std::shared_ptr<Worker>& worker) {
    worker->closed = true;

    std::error_code ec;
    worker->child.terminate(ec);
    if (ec) {
        DRIFTGATE_WARN << "ProcessBridge: cannot kill worker: " << ec.message() << "\n";
    }

    boost::asio::post(strand_, [worker]() {
        boost::system::error_code close_ec;
        worker->stdin_pipe.close(close_ec);
        if (close_ec) {
            DRIFTGATE_WARN << "ProcessBridge: closing worker stdin failed: " << close_ec.message() << "\n";
        }
        worker->stdout_pipe.close(close_ec);
        if (close_ec) {
            DRIFTGATE_WARN << "ProcessBridge: closing worker stdout failed: " << close_ec.message() << "\n";
        }
    });
}

void ProcessBridge::Impl::register_pending(const std::string& id, std::shared_ptr<PendingCall> call) {
    std::scoped_lock lock{pending_mutex_};
    if (shut_down_) {
        throw IpcError{IpcErrc::worker_crashed, "bridge shut down"};
    }
    pending_.emplace(id, std::move(call));
}

std::shared_ptr<ProcessBridge::Impl::PendingCall> ProcessBridge::Impl::take_pending(const std::string& id) {
    std::scoped_lock lock{pending_mutex_};
    auto node = pending_.extract(id);
    if (node.empty()) {
        return nullptr;
    }
    return std::move(node.mapped());
}

ProcessBridge::Impl::PendingTable ProcessBridge::Impl::take_all_pending() {
    std::scoped_lock lock{pending_mutex_};
    return std::exchange(pending_, {});
}

void ProcessBridge::Impl::fail_pending(PendingTable table) {
    if (table.empty()) {
        return;
    }
    boost::asio::post(strand_, [table = std::move(table)]() {
        for (const auto& [id, call] : table) {
            call->error = std::make_exception_ptr(IpcError{IpcErrc::worker_crashed});
            call->completed = true;
            call->timer.cancel();
        }
    });
}

} // namespace driftgate::ipc
