#pragma once
#include <utility>  // needed before Boost 1.74 asio/awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>
#include "../sync/wait_list.hpp"

namespace Wikipath {
namespace Engine {

struct FrontierEntry {
    int         priority = 0;
    std::string node;
};

// Unbounded priority queue of nodes awaiting expansion. Lower priority values
// come out first; equal priorities come out in insertion order.
//
// take() suspends the calling coroutine while the queue is empty. It returns
// an empty optional once the frontier is closed, either explicitly or because
// every registered consumer is waiting on an empty queue (nobody is left to
// produce). Consumers must run on a strand, see WaitList.
class Frontier {
public:
    explicit Frontier(int consumers = 0);

    Frontier(const Frontier&)            = delete;
    Frontier& operator=(const Frontier&) = delete;

    void set_consumers(int consumers);
    void put(int priority, std::string node);
    boost::asio::awaitable<std::optional<FrontierEntry>> take();
    void                                                 close();

    bool   closed() const;
    bool   exhausted() const;
    size_t size() const;

private:
    struct QueuedEntry {
        int           priority;
        std::uint64_t sequence;
        std::string   node;
    };

    struct Later {
        bool operator()(const QueuedEntry& a, const QueuedEntry& b) const {
            if (a.priority != b.priority)
                return a.priority > b.priority;
            return a.sequence > b.sequence;
        }
    };

    FrontierEntry pop_locked();

    mutable std::mutex                                                  mutex_;
    std::priority_queue<QueuedEntry, std::vector<QueuedEntry>, Later> queue_;
    Sync::WaitList                                                      waiters_;
    std::uint64_t                                                       next_sequence_ = 0;
    int                                                                 consumers_;
    bool                                                                closed_    = false;
    bool                                                                exhausted_ = false;
};

}  // namespace Engine
}  // namespace Wikipath
