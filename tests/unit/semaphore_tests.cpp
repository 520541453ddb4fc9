#include <doctest/doctest.h>
#include <sblint/semaphore.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace sblint;

TEST_CASE("Semaphore try_acquire respects the permit count") {
    Semaphore semaphore(2);
    CHECK(semaphore.try_acquire());
    CHECK(semaphore.try_acquire());
    CHECK_FALSE(semaphore.try_acquire());

    semaphore.release();
    CHECK(semaphore.try_acquire());
}

TEST_CASE("Permit releases on destruction") {
    Semaphore semaphore(1);
    {
        Permit permit(semaphore);
        CHECK_FALSE(semaphore.try_acquire());
    }
    CHECK(semaphore.try_acquire());
}

TEST_CASE("Permit can be moved and reset") {
    Semaphore semaphore(1);
    Permit first(semaphore);
    Permit second(std::move(first));
    CHECK_FALSE(semaphore.try_acquire());

    first.reset();
    CHECK_FALSE(semaphore.try_acquire());

    second.reset();
    CHECK(semaphore.try_acquire());
}

TEST_CASE("Semaphore bounds concurrent holders") {
    Semaphore semaphore(2);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            Permit permit(semaphore);
            int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --active;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    CHECK(peak.load() <= 2);
    CHECK(active.load() == 0);
}
