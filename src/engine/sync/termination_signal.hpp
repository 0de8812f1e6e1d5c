#pragma once
#include <atomic>

namespace Wikipath {
namespace Engine {
namespace Sync {

// One-shot "target reached" flag shared by every worker.
class TerminationSignal {
public:
    // Returns true for the call that actually flipped the flag.
    bool set() noexcept {
        return !set_.exchange(true, std::memory_order_acq_rel);
    }

    bool is_set() const noexcept {
        return set_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> set_{false};
};

}  // namespace Sync
}  // namespace Engine
}  // namespace Wikipath
