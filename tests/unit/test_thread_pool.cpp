#include <catch2/catch_test_macros.hpp>
#include "retrace/core/thread_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace retrace::core;

TEST_CASE("Thread pool runs submitted jobs", "[thread_pool]") {
    ThreadPool pool(3);
    REQUIRE(pool.size() == 3);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i] { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        REQUIRE(results[i].get() == i * i);
    }
}

TEST_CASE("Thread pool with zero workers still has one", "[thread_pool]") {
    ThreadPool pool(0);
    REQUIRE(pool.size() == 1);
    REQUIRE(pool.submit([] { return 7; }).get() == 7);
}

TEST_CASE("Thread pool drains queue on shutdown", "[thread_pool]") {
    std::atomic<int> ran{0};
    ThreadPool pool(1);
    for (int i = 0; i < 10; ++i) {
        pool.submit([&ran] { ++ran; });
    }
    pool.shutdown();
    REQUIRE(ran == 10);
    REQUIRE(pool.pending() == 0);

    // Second shutdown is a no-op
    pool.shutdown();
}

TEST_CASE("Thread pool rejects work after shutdown", "[thread_pool]") {
    ThreadPool pool(2);
    pool.shutdown();
    REQUIRE_THROWS_AS(pool.submit([] { return 1; }), PoolStopped);
}

TEST_CASE("Job exceptions surface through the future", "[thread_pool]") {
    ThreadPool pool(1);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
}
