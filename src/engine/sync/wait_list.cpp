#include "wait_list.hpp"
#include <boost/asio/post.hpp>

namespace Wikipath {
namespace Engine {
namespace Sync {

std::shared_ptr<WaitList::Timer> WaitList::add(const boost::asio::any_io_executor& executor) {
    auto timer = std::make_shared<Timer>(executor);
    timer->expires_at(Timer::time_point::max());
    waiters_.push_back(timer);
    return timer;
}

bool WaitList::notify_one() {
    if (waiters_.empty())
        return false;
    auto timer = std::move(waiters_.front());
    waiters_.pop_front();
    wake(timer);
    return true;
}

void WaitList::notify_all() {
    while (notify_one()) {
    }
}

void WaitList::wake(const std::shared_ptr<Timer>& timer) {
    boost::asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
}

}  // namespace Sync
}  // namespace Engine
}  // namespace Wikipath
