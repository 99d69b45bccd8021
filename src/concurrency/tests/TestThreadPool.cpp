/**
 * @file TestThreadPool.cpp
 * @brief Unit tests for concurrency::ThreadPool.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/concurrency/ThreadPool.hpp"

#include <atomic>
#include <stdexcept>

namespace hop::concurrency {

TEST_CASE("ThreadPool runs every submitted task before shutdown returns", "[concurrency][pool]")
{
    std::atomic<int> counter{0};
    ThreadPool pool{3};
    REQUIRE(pool.threadCount() == 3);

    for (int i = 0; i < 100; ++i)
    {
        REQUIRE(pool.submit([&counter] { counter.fetch_add(1); }));
    }

    pool.shutdown();
    REQUIRE(counter.load() == 100);
    REQUIRE(pool.pending() == 0);
}

TEST_CASE("ThreadPool refuses work after shutdown", "[concurrency][pool]")
{
    ThreadPool pool{1};
    pool.shutdown();
    REQUIRE_FALSE(pool.submit([] {}));
}

TEST_CASE("ThreadPool survives a throwing task", "[concurrency][pool]")
{
    std::atomic<bool> ran{false};
    ThreadPool pool{1};
    REQUIRE(pool.submit([] { throw std::runtime_error{"boom"}; }));
    REQUIRE(pool.submit([&ran] { ran = true; }));
    pool.shutdown();
    REQUIRE(ran.load());
}

} // namespace hop::concurrency
