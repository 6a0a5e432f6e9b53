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

#include <stdexcept>
#include <thread>
#include <utility>

#include <driftgate/common/log.hpp>

namespace driftgate::concurrency {

std::ostream& operator<<(std::ostream& out, Context& c) {
    out << "io_context: " << c.io_context();
    return out;
}

Context::Context()
    : io_context_{std::make_shared<boost::asio::io_context>()},
      work_{boost::asio::make_work_guard(*io_context_)} {}

void Context::execute_loop() {
    io_context_->run();
}

void Context::stop() {
    io_context_->stop();
}

ContextPool::ContextPool(std::size_t pool_size) : next_index_{0} {
    if (pool_size == 0) {
        throw std::logic_error("ContextPool::ContextPool pool_size is 0");
    }
    DRIFTGATE_INFO << "ContextPool::ContextPool creating pool with size: " << pool_size << "\n";

    contexts_.reserve(pool_size);
    for (std::size_t i{0}; i < pool_size; ++i) {
        contexts_.emplace_back();
        DRIFTGATE_DEBUG << "ContextPool::ContextPool context[" << i << "] " << contexts_[i] << "\n";
    }
}

ContextPool::~ContextPool() {
    DRIFTGATE_TRACE << "ContextPool::~ContextPool started " << this << "\n";
    stop();
    join();
    DRIFTGATE_TRACE << "ContextPool::~ContextPool completed " << this << "\n";
}

void ContextPool::start() {
    DRIFTGATE_TRACE << "ContextPool::start started\n";

    for (std::size_t i{0}; i < contexts_.size(); ++i) {
        auto& context = contexts_[i];
        context_threads_.create_thread([&, i = i]() {
            DRIFTGATE_DEBUG << "thread start context[" << i << "] thread_id: " << std::this_thread::get_id() << "\n";
            context.execute_loop();
            DRIFTGATE_DEBUG << "thread end context[" << i << "] thread_id: " << std::this_thread::get_id() << "\n";
        });
        DRIFTGATE_DEBUG << "ContextPool::start context[" << i << "].io_context started: " << context.io_context() << "\n";
    }

    DRIFTGATE_TRACE << "ContextPool::start completed\n";
}

void ContextPool::join() {
    DRIFTGATE_TRACE << "ContextPool::join started\n";

    // Wait for all threads in the pool to exit.
    context_threads_.join();

    DRIFTGATE_TRACE << "ContextPool::join completed\n";
}

void ContextPool::stop() {
    DRIFTGATE_TRACE << "ContextPool::stop started\n";

    for (std::size_t i{0}; i < contexts_.size(); ++i) {
        contexts_[i].stop();
        DRIFTGATE_DEBUG << "ContextPool::stop context[" << i << "].io_context stopped: " << contexts_[i].io_context() << "\n";
    }
    DRIFTGATE_TRACE << "ContextPool::stop completed\n";
}

void ContextPool::run() {
    start();
    join();
}

Context& ContextPool::next_context() {
    // Use a round-robin scheme to choose the next context to use
    auto& context = contexts_[next_index_];
    next_index_ = (next_index_ + 1) % contexts_.size();
    return context;
}

boost::asio::io_context& ContextPool::next_io_context() {
    auto& context = next_context();
    return *context.io_context();
}

} // namespace driftgate::concurrency
