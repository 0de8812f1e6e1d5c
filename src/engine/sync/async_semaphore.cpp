#include "async_semaphore.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>

namespace Wikipath {
namespace Engine {
namespace Sync {

AsyncSemaphore::AsyncSemaphore(int permits) : permits_(permits) {
    if (permits < 1)
        throw std::invalid_argument("AsyncSemaphore needs at least one permit");
}

boost::asio::awaitable<void> AsyncSemaphore::acquire() {
    auto executor = co_await boost::asio::this_coro::executor;

    while (true) {
        std::shared_ptr<WaitList::Timer> timer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (permits_ > 0) {
                --permits_;
                co_return;
            }
            timer = waiters_.add(executor);
        }

        boost::system::error_code ec;
        co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

void AsyncSemaphore::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++permits_;
    waiters_.notify_one();
}

int AsyncSemaphore::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return permits_;
}

}  // namespace Sync
}  // namespace Engine
}  // namespace Wikipath
