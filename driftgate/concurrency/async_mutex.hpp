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

#ifndef DRIFTGATE_CONCURRENCY_ASYNC_MUTEX_HPP_
#define DRIFTGATE_CONCURRENCY_ASYNC_MUTEX_HPP_

#include <deque>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace driftgate::concurrency {

//! Mutual exclusion for coroutines: waiters suspend instead of blocking their thread.
//! Ownership is handed over in FIFO order, each waiter resumed on its own associated executor.
class AsyncMutex {
  public:
    AsyncMutex() = default;

    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    template<typename CompletionToken>
    auto async_lock(CompletionToken&& token) {
        return boost::asio::async_initiate<CompletionToken, void()>(
            [this](auto handler) {
                std::unique_lock lock{mutex_};
                if (!locked_) {
                    locked_ = true;
                    lock.unlock();
                    complete(std::move(handler));
                    return;
                }
                using Handler = std::decay_t<decltype(handler)>;
                waiters_.push_back(std::make_unique<WaiterImpl<Handler>>(std::move(handler)));
            }, token);
    }

    bool try_lock();

    void unlock();

    bool is_locked() const;

  private:
    struct Waiter {
        virtual ~Waiter() = default;
        virtual void resume() = 0;
    };

    template<typename Handler>
    struct WaiterImpl : Waiter {
        explicit WaiterImpl(Handler handler) : handler_{std::move(handler)} {}
        void resume() override { complete(std::move(handler_)); }
        Handler handler_;
    };

    template<typename Handler>
    static void complete(Handler handler) {
        auto executor = boost::asio::get_associated_executor(handler);
        boost::asio::post(executor, std::move(handler));
    }

    mutable std::mutex mutex_;
    bool locked_{false};
    std::deque<std::unique_ptr<Waiter>> waiters_;
};

//! Owns one acquisition of an AsyncMutex and releases it on destruction.
class AsyncLockGuard {
  public:
    explicit AsyncLockGuard(AsyncMutex& mutex) noexcept : mutex_{&mutex} {}
    ~AsyncLockGuard() {
        if (mutex_) {
            mutex_->unlock();
        }
    }

    AsyncLockGuard(AsyncLockGuard&& other) noexcept : mutex_{std::exchange(other.mutex_, nullptr)} {}
    AsyncLockGuard& operator=(AsyncLockGuard&&) = delete;
    AsyncLockGuard(const AsyncLockGuard&) = delete;
    AsyncLockGuard& operator=(const AsyncLockGuard&) = delete;

  private:
    AsyncMutex* mutex_;
};

inline boost::asio::awaitable<AsyncLockGuard> scoped_lock(AsyncMutex& mutex) {
    co_await mutex.async_lock(boost::asio::use_awaitable);
    co_return AsyncLockGuard{mutex};
}

} // namespace driftgate::concurrency

#endif // DRIFTGATE_CONCURRENCY_ASYNC_MUTEX_HPP_
