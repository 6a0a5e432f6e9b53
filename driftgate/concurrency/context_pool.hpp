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

#ifndef DRIFTGATE_CONCURRENCY_CONTEXT_POOL_HPP_
#define DRIFTGATE_CONCURRENCY_CONTEXT_POOL_HPP_

#include <cstddef>
#include <iostream>
#include <memory>
#include <vector>

#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp

#include <boost/asio/detail/thread_group.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace driftgate::concurrency {

//! Asynchronous scheduler running a single-threaded execution loop.
class Context {
  public:
    Context();

    boost::asio::io_context* io_context() const noexcept { return io_context_.get(); }

    //! Execute the scheduler loop until stopped.
    void execute_loop();

    //! Stop the execution loop.
    void stop();

  private:
    //! The asynchronous event loop scheduler.
    std::shared_ptr<boost::asio::io_context> io_context_;

    //! The work-tracking guard that keeps the scheduler running while idle.
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
};

std::ostream& operator<<(std::ostream& out, Context& c);

//! Pool of contexts, each one run by its own thread.
class ContextPool {
  public:
    explicit ContextPool(std::size_t pool_size);
    ~ContextPool();

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    void start();

    void join();

    void stop();

    void run();

    std::size_t size() const noexcept { return contexts_.size(); }

    Context& next_context();

    boost::asio::io_context& next_io_context();

  private:
    // The pool of contexts
    std::vector<Context> contexts_;

    //! The pool of threads running the execution contexts.
    boost::asio::detail::thread_group context_threads_;

    // The next index to use for a context
    std::size_t next_index_;
};

} // namespace driftgate::concurrency

#endif // DRIFTGATE_CONCURRENCY_CONTEXT_POOL_HPP_
