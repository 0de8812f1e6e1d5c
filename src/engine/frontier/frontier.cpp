#include "frontier.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace Wikipath {
namespace Engine {

Frontier::Frontier(int consumers) : consumers_(consumers) {
}

void Frontier::set_consumers(int consumers) {
    std::lock_guard<std::mutex> lock(mutex_);
    consumers_ = consumers;
}

void Frontier::put(int priority, std::string node) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        return;
    queue_.push(QueuedEntry{priority, next_sequence_++, std::move(node)});
    waiters_.notify_one();
}

FrontierEntry Frontier::pop_locked() {
    // priority_queue::top() is const; the entry is copied out before pop().
    const QueuedEntry& top = queue_.top();
    FrontierEntry      entry{top.priority, top.node};
    queue_.pop();
    return entry;
}

boost::asio::awaitable<std::optional<FrontierEntry>> Frontier::take() {
    auto executor = co_await boost::asio::this_coro::executor;

    while (true) {
        std::shared_ptr<Sync::WaitList::Timer> timer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                co_return std::nullopt;
            if (!queue_.empty())
                co_return pop_locked();

            if (consumers_ > 0 && static_cast<int>(waiters_.size()) + 1 >= consumers_) {
                exhausted_ = true;
                closed_    = true;
                waiters_.notify_all();
                co_return std::nullopt;
            }
            timer = waiters_.add(executor);
        }

        boost::system::error_code ec;
        co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

void Frontier::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    waiters_.notify_all();
}

bool Frontier::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool Frontier::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exhausted_;
}

size_t Frontier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace Engine
}  // namespace Wikipath
