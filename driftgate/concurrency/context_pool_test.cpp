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

#include "context_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/post.hpp>
#include <catch2/catch.hpp>

#include <driftgate/common/log.hpp>

namespace driftgate::concurrency {

using Catch::Matchers::Message;

TEST_CASE("Context", "[driftgate][concurrency][context_pool]") {
    DRIFTGATE_LOG_VERBOSITY(LogLevel::None);
    Context context;

    SECTION("Context::Context") {
        CHECK(context.io_context() != nullptr);
    }

    SECTION("Context::execute_loop") {
        std::atomic_bool processed{false};
        auto* io_context = context.io_context();
        boost::asio::post(*io_context, [&]() {
            processed = true;
            io_context->stop();
        });
        auto context_thread = std::thread([&]() { context.execute_loop(); });
        CHECK_NOTHROW(context_thread.join());
        CHECK(processed);
    }

    SECTION("Context::stop") {
        auto context_thread = std::thread([&]() { context.execute_loop(); });
        CHECK_NOTHROW(context.stop());
        CHECK_NOTHROW(context_thread.join());
    }
}

TEST_CASE("create context pool", "[driftgate][concurrency][context_pool]") {
    DRIFTGATE_LOG_VERBOSITY(LogLevel::None);

    SECTION("reject size 0") {
        CHECK_THROWS_MATCHES((ContextPool{0}), std::logic_error, Message("ContextPool::ContextPool pool_size is 0"));
    }

    SECTION("accept size 1") {
        ContextPool cp{1};
        CHECK(cp.size() == 1);
        CHECK(&cp.next_context() == &cp.next_context());
        CHECK(&cp.next_io_context() == &cp.next_io_context());
    }

    SECTION("round robin over size greater than 1") {
        ContextPool cp{3};

        const auto& context1 = cp.next_context();
        const auto& context2 = cp.next_context();
        const auto& context3 = cp.next_context();
        const auto& context4 = cp.next_context();

        CHECK(&context1 != &context2);
        CHECK(&context2 != &context3);
        CHECK(&context1 == &context4);

        const auto& io_context1 = cp.next_io_context();
        cp.next_io_context();
        cp.next_io_context();
        const auto& io_context4 = cp.next_io_context();
        CHECK(&io_context1 == &io_context4);
    }
}

TEST_CASE("start context pool", "[driftgate][concurrency][context_pool]") {
    DRIFTGATE_LOG_VERBOSITY(LogLevel::None);

    SECTION("running 1 thread") {
        ContextPool cp{1};
        auto context_pool_thread = std::thread([&]() { cp.run(); });
        cp.stop();
        CHECK_NOTHROW(context_pool_thread.join());
    }

    SECTION("running 3 threads") {
        ContextPool cp{3};
        auto context_pool_thread = std::thread([&]() { cp.run(); });
        cp.stop();
        CHECK_NOTHROW(context_pool_thread.join());
    }

    SECTION("work posted to every context is executed") {
        ContextPool cp{3};
        cp.start();
        std::atomic_int executed{0};
        for (int i{0}; i < 6; ++i) {
            boost::asio::post(cp.next_io_context(), [&]() { ++executed; });
        }
        while (executed < 6) {
            std::this_thread::yield();
        }
        cp.stop();
        cp.join();
        CHECK(executed == 6);
    }
}

TEST_CASE("stop context pool", "[driftgate][concurrency][context_pool]") {
    DRIFTGATE_LOG_VERBOSITY(LogLevel::None);

    SECTION("not yet running") {
        ContextPool cp{3};
        CHECK_NOTHROW(cp.stop());
    }

    SECTION("already stopped") {
        ContextPool cp{3};
        auto context_pool_thread = std::thread([&]() { cp.run(); });
        cp.stop();
        CHECK_NOTHROW(cp.stop());
        context_pool_thread.join();
        CHECK_NOTHROW(cp.stop());
    }
}

TEST_CASE("print context pool", "[driftgate][concurrency][context_pool]") {
    DRIFTGATE_LOG_VERBOSITY(LogLevel::None);
    ContextPool cp{1};
    CHECK_NOTHROW(null_stream() << cp.next_context());
}

} // namespace driftgate::concurrency
