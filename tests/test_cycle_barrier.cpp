#include <doctest/doctest.h>
#include <chrono>
#include <thread>
#include <vector>
#include "fedsim/cycle_barrier.hpp"
using namespace fedsim;

TEST_CASE("Barrier releases once every worker reported") {
    CycleBarrier b;
    b.reset(4);
    std::vector<std::thread> ts;
    for (std::size_t i = 0; i < 4; ++i)
        ts.emplace_back([&b, i] { b.worker_done(i, i != 2); });
    CHECK(b.wait_for_all(2000));
    for (auto& t : ts) t.join();
    CHECK(b.done_count() == 4);
    CHECK_FALSE(b.all_succeeded());
}

TEST_CASE("Barrier times out and reports the stragglers") {
    CycleBarrier b;
    b.reset(3);
    b.worker_done(0, true);
    b.worker_done(2, true);
    const auto t0 = std::chrono::steady_clock::now();
    CHECK_FALSE(b.wait_for_all(50));
    CHECK(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(45));
    CHECK(b.completed(0));
    CHECK_FALSE(b.completed(1));
    CHECK(b.completed(2));
}

TEST_CASE("Repeated and out-of-range reports are ignored") {
    CycleBarrier b;
    b.reset(2);
    b.worker_done(0, true);
    b.worker_done(0, false);
    b.worker_done(9, true);
    CHECK(b.done_count() == 1);
    CHECK_FALSE(b.wait_for_all(0));
    b.worker_done(1, true);
    CHECK(b.wait_for_all(0));
    CHECK(b.all_succeeded());
}

TEST_CASE("An empty barrier is immediately complete") {
    CycleBarrier b;
    b.reset(0);
    CHECK(b.wait_for_all(0));
    CHECK(b.workers() == 0);
}
