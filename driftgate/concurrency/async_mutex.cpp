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

namespace driftgate::concurrency {

bool AsyncMutex::try_lock() {
    std::scoped_lock lock{mutex_};
    if (locked_) {
        return false;
    }
    locked_ = true;
    return true;
}

void AsyncMutex::unlock() {
    std::unique_ptr<Waiter> next;
    {
        std::scoped_lock lock{mutex_};
        if (waiters_.empty()) {
            locked_ = false;
            return;
        }
        next = std::move(waiters_.front());
        waiters_.pop_front();
    }
    // ownership passes to the next waiter without releasing
    next->resume();
}

bool AsyncMutex::is_locked() const {
    std::scoped_lock lock{mutex_};
    return locked_;
}

} // namespace driftgate::concurrency
