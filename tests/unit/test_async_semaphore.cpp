#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include "../../src/engine/sync/async_semaphore.hpp"
#include "test_utils.hpp"

using Wikipath::Engine::Sync::AsyncSemaphore;
using Wikipath::Engine::Sync::SemaphoreGuard;
using Wikipath::Test::run_coroutine;
namespace asio = boost::asio;

namespace {

struct Occupancy {
    std::atomic<int> current{0};
    std::atomic<int> peak{0};
    std::atomic<int> done{0};
};

asio::awaitable<void> hold_permit(AsyncSemaphore& semaphore, Occupancy* occupancy) {
    co_await semaphore.acquire();
    SemaphoreGuard guard(semaphore);

    int now  = ++occupancy->current;
    int peak = occupancy->peak.load();
    while (now > peak && !occupancy->peak.compare_exchange_weak(peak, now)) {
    }

    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(std::chrono::milliseconds(5));
    co_await timer.async_wait(asio::use_awaitable);

    --occupancy->current;
    ++occupancy->done;
}

asio::awaitable<void> acquire_twice(AsyncSemaphore& semaphore) {
    co_await semaphore.acquire();
    co_await semaphore.acquire();
}

asio::awaitable<void> acquire_flag(AsyncSemaphore& semaphore, bool* acquired) {
    co_await semaphore.acquire();
    *acquired = true;
}

}  // namespace

TEST(AsyncSemaphoreTest, RejectsZeroPermits) {
    EXPECT_THROW(AsyncSemaphore(0), std::invalid_argument);
    EXPECT_THROW(AsyncSemaphore(-3), std::invalid_argument);
}

TEST(AsyncSemaphoreTest, AcquireConsumesPermits) {
    AsyncSemaphore semaphore(2);
    run_coroutine(acquire_twice(semaphore));
    EXPECT_EQ(semaphore.available(), 0);

    semaphore.release();
    EXPECT_EQ(semaphore.available(), 1);
}

TEST(AsyncSemaphoreTest, AcquireWaitsForRelease) {
    AsyncSemaphore   semaphore(1);
    bool             acquired = false;
    asio::io_context ioc;

    run_coroutine(semaphore.acquire());
    asio::co_spawn(ioc, acquire_flag(semaphore, &acquired), asio::detached);
    ioc.run_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(acquired);

    semaphore.release();
    ioc.restart();
    ioc.run();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(semaphore.available(), 0);
}

TEST(AsyncSemaphoreTest, GuardReleasesOnScopeExit) {
    AsyncSemaphore semaphore(1);
    run_coroutine(semaphore.acquire());
    {
        SemaphoreGuard guard(semaphore);
        EXPECT_EQ(semaphore.available(), 0);
    }
    EXPECT_EQ(semaphore.available(), 1);
}

TEST(AsyncSemaphoreTest, BoundsConcurrentHoldersAcrossThreads) {
    AsyncSemaphore   semaphore(3);
    Occupancy        occupancy;
    asio::io_context ioc;

    for (int i = 0; i < 40; ++i)
        asio::co_spawn(asio::make_strand(ioc), hold_permit(semaphore, &occupancy), asio::detached);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
        threads.emplace_back([&ioc]() { ioc.run(); });
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(occupancy.done.load(), 40);
    EXPECT_LE(occupancy.peak.load(), 3);
    EXPECT_GE(occupancy.peak.load(), 1);
    EXPECT_EQ(semaphore.available(), 3);
}
