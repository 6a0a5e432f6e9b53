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

#include "async_mutex.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>

namespace driftgate::concurrency {

using namespace std::chrono_literals; // NOLINT(build/namespaces)

TEST_CASE("AsyncMutex try_lock and unlock", "[driftgate][concurrency][async_mutex]") {
    AsyncMutex mutex;
    CHECK(!mutex.is_locked());
    CHECK(mutex.try_lock());
    CHECK(mutex.is_locked());
    CHECK(!mutex.try_lock());
    mutex.unlock();
    CHECK(!mutex.is_locked());
}

TEST_CASE("AsyncMutex scoped lock releases on exit", "[driftgate][concurrency][async_mutex]") {
    AsyncMutex mutex;
    boost::asio::thread_pool pool{1};
    auto result = boost::asio::co_spawn(pool, [&]() -> boost::asio::awaitable<bool> {
        auto guard = co_await scoped_lock(mutex);
        co_return mutex.is_locked();
    }, boost::asio::use_future);
    CHECK(result.get());
    CHECK(!mutex.is_locked());
}

TEST_CASE("AsyncMutex serialises critical sections", "[driftgate][concurrency][async_mutex]") {
    AsyncMutex mutex;
    boost::asio::thread_pool pool{4};

    struct Span {
        std::chrono::steady_clock::time_point begin;
        std::chrono::steady_clock::time_point end;
    };
    std::mutex spans_mutex;
    std::vector<Span> spans;

    auto critical_section = [&]() -> boost::asio::awaitable<void> {
        auto guard = co_await scoped_lock(mutex);
        const auto begin = std::chrono::steady_clock::now();
        boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor, 10ms};
        co_await timer.async_wait(boost::asio::use_awaitable);
        const auto end = std::chrono::steady_clock::now();
        std::scoped_lock lock{spans_mutex};
        spans.push_back({begin, end});
    };

    std::vector<std::future<void>> results;
    for (int i{0}; i < 5; ++i) {
        results.push_back(boost::asio::co_spawn(pool, critical_section(), boost::asio::use_future));
    }
    for (auto& result : results) {
        CHECK_NOTHROW(result.get());
    }

    REQUIRE(spans.size() == 5);
    std::sort(spans.begin(), spans.end(), [](const auto& lhs, const auto& rhs) { return lhs.begin < rhs.begin; });
    for (std::size_t i{1}; i < spans.size(); ++i) {
        CHECK(spans[i - 1].end <= spans[i].begin);
    }
    CHECK(!mutex.is_locked());
}

TEST_CASE("AsyncMutex hands over in arrival order", "[driftgate][concurrency][async_mutex]") {
    AsyncMutex mutex;
    REQUIRE(mutex.try_lock());
    boost::asio::thread_pool pool{1};
    std::vector<int> order;

    std::vector<std::future<void>> results;
    for (int i{0}; i < 3; ++i) {
        results.push_back(boost::asio::co_spawn(pool, [&, i]() -> boost::asio::awaitable<void> {
            auto guard = co_await scoped_lock(mutex);
            order.push_back(i);
        }, boost::asio::use_future));
        // let the waiter enqueue before spawning the next one
        boost::asio::co_spawn(pool, []() -> boost::asio::awaitable<void> { co_return; }, boost::asio::use_future).get();
    }
    mutex.unlock();
    for (auto& result : results) {
        result.get();
    }
    CHECK(order == std::vector<int>{0, 1, 2});
}

} // namespace driftgate::concurrency
