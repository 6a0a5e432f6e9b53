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

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>

#include <driftgate/common/log.hpp>
#include <driftgate/ipc/error.hpp>

namespace driftgate::ipc {

using namespace std::chrono_literals;

class BridgeFixture {
  public:
    explicit BridgeFixture(std::vector<std::string> args, std::string program = DRIFTGATE_FAKE_WORKER_PATH)
        : bridge{io_context, WorkerSettings{std::move(program), std::move(args)}},
          work{boost::asio::make_work_guard(io_context)},
          runner{[&]() { io_context.run(); }} {
        DRIFTGATE_LOG_STREAMS(null_stream(), null_stream());
        DRIFTGATE_LOG_VERBOSITY(LogLevel::None);
    }

    ~BridgeFixture() {
        bridge.shutdown();
        work.reset();
        io_context.stop();
        runner.join();
    }

    std::future<nlohmann::json> submit(const std::string& function, nlohmann::json args = nlohmann::json::object(),
                                       std::chrono::milliseconds timeout = 5s) {
        return boost::asio::co_spawn(io_context, bridge.submit(function, std::move(args), timeout), boost::asio::use_future);
    }

    void wait_pending(std::size_t count) {
        for (int i{0}; i < 500 && bridge.pending_count() != count; ++i) {
            std::this_thread::sleep_for(10ms);
        }
    }

    boost::asio::io_context io_context;
    ProcessBridge bridge;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
    std::thread runner;
};

static std::optional<IpcErrc> failure_of(std::future<nlohmann::json>& result) {
    try {
        result.get();
    } catch (const IpcError& e) {
        return e.errc();
    }
    return std::nullopt;
}

TEST_CASE("worker settings", "[driftgate][ipc][process_bridge]") {
    const WorkerSettings defaults;
    CHECK(defaults.program == "node");
    CHECK(defaults.args == std::vector<std::string>{"--enable-source-maps", "../ts-worker/dist/index.js"});

    const auto settings = make_node_worker_settings("/usr/bin/node", "/opt/worker/index.js");
    CHECK(settings.program == "/usr/bin/node");
    CHECK(settings.args == std::vector<std::string>{"--enable-source-maps", "/opt/worker/index.js"});
}

TEST_CASE("process bridge lifecycle", "[driftgate][ipc][process_bridge]") {
    SECTION("spawns lazily on first call") {
        BridgeFixture fixture{{"--mode=echo"}};
        CHECK(fixture.bridge.state() == WorkerState::kNoWorker);
        CHECK(fixture.bridge.spawn_count() == 0);

        auto result = fixture.submit("buildDeposit", {{"amount", 5}});
        CHECK(result.get() == R"({"fn":"buildDeposit","args":{"amount":5}})"_json);
        CHECK(fixture.bridge.state() == WorkerState::kReady);
        CHECK(fixture.bridge.spawn_count() == 1);
        CHECK(fixture.bridge.pending_count() == 0);
    }

    SECTION("connect spawns eagerly") {
        BridgeFixture fixture{{"--mode=echo"}};
        fixture.bridge.connect();
        CHECK(fixture.bridge.state() == WorkerState::kReady);
        fixture.bridge.connect();
        CHECK(fixture.bridge.spawn_count() == 1);
    }

    SECTION("spawn failure leaves no worker") {
        BridgeFixture fixture{{}, "/nonexistent/driftgate-worker"};
        auto result = fixture.submit("buildDeposit");
        CHECK(failure_of(result) == IpcErrc::spawn);
        CHECK(fixture.bridge.state() == WorkerState::kNoWorker);
        CHECK(fixture.bridge.spawn_count() == 0);
    }

    SECTION("shutdown fails pending calls") {
        BridgeFixture fixture{{"--mode=echo"}};
        auto result = fixture.submit("ignore", nlohmann::json::object(), 30s);
        fixture.wait_pending(1);
        REQUIRE(fixture.bridge.pending_count() == 1);
        fixture.bridge.shutdown();
        CHECK(failure_of(result) == IpcErrc::worker_crashed);
        CHECK(fixture.bridge.state() == WorkerState::kNoWorker);
        CHECK(fixture.bridge.spawn_count() == 1);
        CHECK(fixture.bridge.pending_count() == 0);
    }

    SECTION("calls after shutdown fail without spawning") {
        BridgeFixture fixture{{"--mode=echo"}};
        fixture.bridge.connect();
        fixture.bridge.shutdown();

        auto result = fixture.submit("buildDeposit");
        CHECK(failure_of(result) == IpcErrc::worker_crashed);
        CHECK_THROWS_AS(fixture.bridge.connect(), IpcError);
        CHECK(fixture.bridge.state() == WorkerState::kNoWorker);
        CHECK(fixture.bridge.spawn_count() == 1);
    }
}

TEST_CASE("process bridge destroyed with calls in flight", "[driftgate][ipc][process_bridge]") {
    DRIFTGATE_LOG_STREAMS(null_stream(), null_stream());
    DRIFTGATE_LOG_VERBOSITY(LogLevel::None);

    boost::asio::io_context io_context;
    auto work = boost::asio::make_work_guard(io_context);
    std::thread runner{[&]() { io_context.run(); }};

    auto bridge = std::make_unique<ProcessBridge>(io_context, WorkerSettings{DRIFTGATE_FAKE_WORKER_PATH, {"--mode=echo"}});
    auto result = boost::asio::co_spawn(io_context, bridge->submit("ignore", nlohmann::json::object(), 30s), boost::asio::use_future);
    for (int i{0}; i < 500 && bridge->pending_count() != 1; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(bridge->pending_count() == 1);

    bridge.reset();
    REQUIRE(result.wait_for(5s) == std::future_status::ready);
    CHECK(failure_of(result) == IpcErrc::worker_crashed);

    work.reset();
    io_context.stop();
    runner.join();
}

TEST_CASE("process bridge responses", "[driftgate][ipc][process_bridge]") {
    BridgeFixture fixture{{"--mode=echo"}};

    SECTION("remote error carries worker message") {
        auto result = fixture.submit("fail", {{"message", "market paused"}});
        try {
            result.get();
            FAIL("expected IpcError");
        } catch (const IpcError& e) {
            CHECK(e.errc() == IpcErrc::remote);
            CHECK(e.detail() == "market paused");
        }
        CHECK(fixture.bridge.spawn_count() == 1);
    }

    SECTION("remote error without message") {
        auto result = fixture.submit("fail_silently");
        CHECK_THROWS_WITH(result.get(), "worker returned error: worker error without message");
    }

    SECTION("ok without result is a protocol error") {
        auto result = fixture.submit("no_result");
        CHECK(failure_of(result) == IpcErrc::protocol);
        CHECK(fixture.bridge.spawn_count() == 1);
    }

    SECTION("unparseable lines and unknown ids are skipped") {
        auto result = fixture.submit("noisy", {{"n", 1}});
        CHECK(result.get() == R"({"fn":"noisy","args":{"n":1}})"_json);
        CHECK(fixture.bridge.state() == WorkerState::kReady);
    }

    SECTION("timeout removes the pending call") {
        auto result = fixture.submit("ignore", nlohmann::json::object(), 100ms);
        CHECK(failure_of(result) == IpcErrc::timeout);
        CHECK(fixture.bridge.pending_count() == 0);
        CHECK(fixture.bridge.spawn_count() == 1);

        auto next = fixture.submit("buildWithdraw");
        CHECK(next.get().at("fn") == "buildWithdraw");
    }
}

TEST_CASE("process bridge drops responses arriving after timeout", "[driftgate][ipc][process_bridge]") {
    BridgeFixture fixture{{"--mode=echo", "--delay_ms=300"}};

    auto result = fixture.submit("slow", {{"n", 1}}, 100ms);
    CHECK(failure_of(result) == IpcErrc::timeout);
    CHECK(fixture.bridge.pending_count() == 0);

    // the worker replies to the abandoned call meanwhile
    std::this_thread::sleep_for(400ms);
    CHECK(fixture.bridge.state() == WorkerState::kReady);
    CHECK(fixture.bridge.pending_count() == 0);
    CHECK(fixture.bridge.spawn_count() == 1);

    auto next = fixture.submit("buildWithdraw", {{"n", 2}});
    CHECK(next.get() == R"({"fn":"buildWithdraw","args":{"n":2}})"_json);
    CHECK(fixture.bridge.spawn_count() == 1);
}

TEST_CASE("process bridge correlates out of order responses", "[driftgate][ipc][process_bridge]") {
    BridgeFixture fixture{{"--mode=reversed"}};
    std::vector<std::future<nlohmann::json>> results;
    for (int i{0}; i < 4; ++i) {
        results.push_back(fixture.submit("call", {{"n", i}}));
    }
    for (int i{0}; i < 4; ++i) {
        CHECK(results[i].get() == nlohmann::json{{"fn", "call"}, {"args", {{"n", i}}}});
    }
    CHECK(fixture.bridge.pending_count() == 0);
}

TEST_CASE("process bridge worker crash", "[driftgate][ipc][process_bridge]") {
    SECTION("pending calls fail after one respawn") {
        BridgeFixture fixture{{"--mode=echo", "--crash_after=3"}};
        fixture.bridge.connect();
        std::vector<std::future<nlohmann::json>> results;
        for (int i{0}; i < 3; ++i) {
            results.push_back(fixture.submit("ignore", {{"n", i}}));
        }
        for (auto& result : results) {
            CHECK(failure_of(result) == IpcErrc::worker_crashed);
        }
        CHECK(fixture.bridge.spawn_count() == 2);
        CHECK(fixture.bridge.state() == WorkerState::kCrashed);

        auto next = fixture.submit("call", {{"n", 3}});
        CHECK(next.get() == R"({"fn":"call","args":{"n":3}})"_json);
        CHECK(fixture.bridge.spawn_count() == 3);
        CHECK(fixture.bridge.state() == WorkerState::kReady);
    }

    SECTION("retry succeeds on a fresh worker") {
        BridgeFixture fixture{{"--mode=echo", "--crash_after=2"}};
        auto first = fixture.submit("call", {{"n", 0}});
        CHECK(first.get() == R"({"fn":"call","args":{"n":0}})"_json);

        auto second = fixture.submit("call", {{"n", 1}});
        CHECK(second.get() == R"({"fn":"call","args":{"n":1}})"_json);
        CHECK(fixture.bridge.spawn_count() == 2);
    }

    SECTION("worker exiting on start") {
        BridgeFixture fixture{{"--mode=crash_on_start"}};
        auto result = fixture.submit("call");
        const auto errc = failure_of(result);
        CHECK((errc == IpcErrc::worker_crashed || errc == IpcErrc::write));
        CHECK(fixture.bridge.spawn_count() == 2);
    }
}

TEST_CASE("worker state printing", "[driftgate][ipc][process_bridge]") {
    std::ostringstream out;
    out << WorkerState::kNoWorker << " " << WorkerState::kCrashed;
    CHECK(out.str() == "no-worker crashed");
}

} // namespace driftgate::ipc
