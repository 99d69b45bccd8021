/**
 * @file TestMigrationPrimitives.cpp
 * @brief Unit tests for CallChain, RecentIdCache, PairLock and the
 *        capture / restore validation.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/migration/CallChain.hpp"
#include "hop/migration/InMemoryHost.hpp"
#include "hop/migration/PairLock.hpp"
#include "hop/migration/RecentIdCache.hpp"
#include "hop/migration/SnapshotCapturer.hpp"
#include "hop/migration/StateRestorer.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace hop::migration {

using namespace std::chrono_literals;

TEST_CASE("CallChain migrates back only at the recorded height", "[migration][callchain]")
{
    CallChain chain;

    REQUIRE_FALSE(chain.enter("a", "a", 1));
    REQUIRE(chain.empty());

    REQUIRE(chain.enter("a", "b", 4));
    REQUIRE(chain.depth() == 1);

    REQUIRE_FALSE(chain.exit("b", 6).has_value());
    REQUIRE(chain.depth() == 1);

    const auto back = chain.exit("b", 4);
    REQUIRE(back.has_value());
    REQUIRE(*back == "a");
    REQUIRE(chain.empty());
}

TEST_CASE("CallChain never returns to the current node", "[migration][callchain]")
{
    CallChain chain{{serial::CallFrame{"a", 2}}};
    REQUIRE_FALSE(chain.exit("a", 2).has_value());
    REQUIRE(chain.empty());
}

TEST_CASE("RecentIdCache keeps acknowledgments only and evicts the oldest", "[migration][cache]")
{
    RecentIdCache cache{2};

    cache.insert(net::protocol::MigrationResponse::rejected(1, net::protocol::RejectReason::RestoreFailed, "x"));
    REQUIRE_FALSE(cache.find(1).has_value());

    cache.insert(net::protocol::MigrationResponse::acknowledged(2));
    cache.insert(net::protocol::MigrationResponse::acknowledged(3));
    cache.insert(net::protocol::MigrationResponse::acknowledged(4));

    REQUIRE(cache.size() == 2);
    REQUIRE_FALSE(cache.find(2).has_value());
    REQUIRE(cache.find(3).has_value());
    REQUIRE(cache.find(4)->isAcknowledged());
}

TEST_CASE("PairLock serialises one pair in arrival order", "[migration][pairlock]")
{
    PairLock lock;
    std::vector<int> order;
    std::mutex orderMutex;

    auto first = std::make_unique<PairLock::Guard>(lock.acquire("a", "b"));

    std::thread second{[&] {
        const auto guard = lock.acquire("a", "b");
        std::lock_guard l{orderMutex};
        order.push_back(2);
    }};

    while (lock.queued("a", "b") < 2)
        std::this_thread::sleep_for(1ms);

    {
        // A different pair is never blocked.
        const auto other = lock.acquire("a", "c");
        std::lock_guard l{orderMutex};
        order.push_back(0);
    }

    {
        std::lock_guard l{orderMutex};
        order.push_back(1);
    }
    first.reset();
    second.join();

    REQUIRE((order == std::vector<int>{0, 1, 2}));
    REQUIRE(lock.queued("a", "b") == 0);
}

TEST_CASE("Capture rejects unaligned memory", "[migration][capture]")
{
    InMemoryHost host{1, 1};
    host.resizeMemory(0);

    const SnapshotCapturer capturer{host};
    const auto snapshot = capturer.capture({});
    REQUIRE_FALSE(snapshot.has_value());
    REQUIRE(snapshot.error().code() == core::ErrorCode::kCaptureFailure);
}

TEST_CASE("Capture attaches the call chain and wraps host errors", "[migration][capture]")
{
    InMemoryHost host{1, 2};
    host.setGlobals({serial::GlobalValue::i64(42)});
    const SnapshotCapturer capturer{host};

    const auto snapshot = capturer.capture({serial::CallFrame{"edge", 3}});
    REQUIRE(snapshot.has_value());
    REQUIRE(snapshot->memory().pages() == 2);
    REQUIRE(snapshot->globals().front().asI64() == 42);
    REQUIRE((snapshot->callChain().front() == serial::CallFrame{"edge", 3}));

    host.failNextCapture("stack walk failed");
    REQUIRE(capturer.capture({}).error().code() == core::ErrorCode::kCaptureFailure);
}

TEST_CASE("Restore validates memory then resumes the host", "[migration][restore]")
{
    InMemoryHost host{1, 1};
    const StateRestorer restorer{host};

    SECTION("size mismatch")
    {
        serial::ExecutionSnapshot snapshot{{}, {}, serial::MemoryImage::full(core::Bytes(100), false, 1)};
        REQUIRE(restorer.restore(std::move(snapshot)).error().code() == core::ErrorCode::kRestoreFailure);
        REQUIRE(host.restoreCount() == 0);
    }

    SECTION("host failure")
    {
        host.failNextRestore("out of memory");
        serial::ExecutionSnapshot snapshot{{}, {}, serial::MemoryImage::full(core::Bytes(core::kPageSize))};
        REQUIRE(restorer.restore(std::move(snapshot)).error().code() == core::ErrorCode::kRestoreFailure);
        REQUIRE_FALSE(host.running());
    }

    SECTION("success")
    {
        core::Bytes memory(2 * core::kPageSize, core::byte{7});
        serial::ExecutionSnapshot snapshot{core::Bytes{core::byte{9}}, {}, serial::MemoryImage::full(memory)};
        REQUIRE(restorer.restore(std::move(snapshot)).has_value());
        REQUIRE(host.memory() == memory);
        REQUIRE(host.stack() == core::Bytes{core::byte{9}});
        REQUIRE(host.running());
        REQUIRE(host.resumeCount() == 1);
    }
}

} // namespace hop::migration
