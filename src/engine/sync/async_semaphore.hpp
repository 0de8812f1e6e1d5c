#pragma once
#include <utility>  // needed before Boost 1.74 asio/awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <mutex>
#include "wait_list.hpp"

namespace Wikipath {
namespace Engine {
namespace Sync {

// Counting semaphore for coroutines. acquire() suspends instead of blocking
// the I/O thread while no permit is available.
class AsyncSemaphore {
public:
    explicit AsyncSemaphore(int permits);

    AsyncSemaphore(const AsyncSemaphore&)            = delete;
    AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;

    boost::asio::awaitable<void> acquire();
    void                         release();
    int                          available() const;

private:
    mutable std::mutex mutex_;
    int                permits_;
    WaitList           waiters_;
};

class SemaphoreGuard {
public:
    explicit SemaphoreGuard(AsyncSemaphore& semaphore) : semaphore_(semaphore) {
    }
    ~SemaphoreGuard() {
        semaphore_.release();
    }
    SemaphoreGuard(const SemaphoreGuard&)            = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

private:
    AsyncSemaphore& semaphore_;
};

}  // namespace Sync
}  // namespace Engine
}  // namespace Wikipath
