#pragma once
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <deque>
#include <memory>

namespace Wikipath {
namespace Engine {
namespace Sync {

// Parked coroutines, each waiting on a timer that never expires on its own.
// Notifying a waiter cancels its timer on the waiter's own executor.
//
// The owner guards every call with its mutex. A waiter must register, release
// the mutex and start async_wait without yielding its executor in between;
// running each waiter on a strand (or a single-threaded io_context) makes the
// posted cancel land after the wait has started.
class WaitList {
public:
    using Timer = boost::asio::steady_timer;

    std::shared_ptr<Timer> add(const boost::asio::any_io_executor& executor);
    bool                   notify_one();
    void                   notify_all();
    size_t                 size() const {
        return waiters_.size();
    }

private:
    static void wake(const std::shared_ptr<Timer>& timer);

    std::deque<std::shared_ptr<Timer>> waiters_;
};

}  // namespace Sync
}  // namespace Engine
}  // namespace Wikipath
