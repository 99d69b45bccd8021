/**
 * @file TestHeartbeatMonitor.cpp
 * @brief Unit tests for liveness::HeartbeatRecord and HeartbeatMonitor.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/liveness/HeartbeatMonitor.hpp"

#include <atomic>
#include <thread>

namespace hop::liveness {

namespace {

using namespace std::chrono_literals;

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds limit = 2s)
{
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST_CASE("HeartbeatRecord walks Healthy, Suspect, Lost", "[liveness][record]")
{
    HeartbeatRecord record{"b"};
    REQUIRE(record.state() == LivenessState::Healthy);

    REQUIRE(record.markMissed(3) == LivenessState::Suspect);
    REQUIRE(record.markMissed(3) == LivenessState::Suspect);

    record.markSeen();
    REQUIRE(record.state() == LivenessState::Healthy);
    REQUIRE(record.missedCount() == 0);

    REQUIRE(record.markMissed(3) == LivenessState::Suspect);
    REQUIRE(record.markMissed(3) == LivenessState::Suspect);
    REQUIRE(record.markMissed(3) == LivenessState::Lost);

    // Lost is terminal.
    record.markSeen();
    REQUIRE(record.state() == LivenessState::Lost);
    REQUIRE(record.markMissed(3) == LivenessState::Lost);
}

TEST_CASE("HeartbeatRecord waits for the minimum silence before Lost", "[liveness][record]")
{
    HeartbeatRecord record{"b"};
    const auto t0 = HeartbeatRecord::Clock::now();

    REQUIRE(record.markMissed(2, 100ms, t0) == LivenessState::Suspect);
    REQUIRE(record.markMissed(2, 100ms, t0 + 40ms) == LivenessState::Suspect);
    REQUIRE(record.markMissed(2, 100ms, t0 + 80ms) == LivenessState::Suspect);
    REQUIRE(record.missedCount() == 3);

    // A success restarts the streak clock.
    record.markSeen(t0 + 90ms);
    REQUIRE(record.markMissed(2, 100ms, t0 + 120ms) == LivenessState::Suspect);
    REQUIRE(record.markMissed(2, 100ms, t0 + 200ms) == LivenessState::Suspect);
    REQUIRE(record.markMissed(2, 100ms, t0 + 220ms) == LivenessState::Lost);
}

TEST_CASE("A monitor keeps probing until the minimum silence elapsed", "[liveness][monitor]")
{
    std::atomic<int> probes{0};
    std::atomic<int> fired{0};

    HeartbeatMonitor monitor{"b", 10ms, 2,
                             [&probes] {
                                 ++probes;
                                 return false;
                             },
                             [&fired](const core::NodeId &) { ++fired; }, true, 80ms};
    const auto start = std::chrono::steady_clock::now();
    monitor.start();

    REQUIRE(waitFor([&fired] { return fired.load() > 0; }));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(fired.load() == 1);
    REQUIRE(probes.load() > 2);
    REQUIRE(elapsed >= 80ms);
    REQUIRE(monitor.state() == LivenessState::Lost);
}

TEST_CASE("A silent target is declared lost and the action fires once", "[liveness][monitor]")
{
    std::atomic<int> probes{0};
    std::atomic<int> fired{0};

    HeartbeatMonitor monitor{"b", 10ms, 3,
                             [&probes] {
                                 ++probes;
                                 return false;
                             },
                             [&fired](const core::NodeId &) { ++fired; }};
    monitor.start();

    REQUIRE(waitFor([&fired] { return fired.load() > 0; }));
    std::this_thread::sleep_for(60ms);

    REQUIRE(fired.load() == 1);
    REQUIRE(probes.load() == 3);
    REQUIRE(monitor.state() == LivenessState::Lost);
}

TEST_CASE("A recovered target resets its missed count", "[liveness][monitor]")
{
    std::atomic<int> tick{0};
    std::atomic<int> fired{0};

    // Misses twice, answers once, repeats: never three misses in a row.
    HeartbeatMonitor monitor{"b", 5ms, 3,
                             [&tick] { return ++tick % 3 == 0; },
                             [&fired](const core::NodeId &) { ++fired; }};
    monitor.start();

    REQUIRE(waitFor([&tick] { return tick.load() >= 12; }));
    monitor.stop();

    REQUIRE(fired.load() == 0);
    REQUIRE(monitor.state() != LivenessState::Lost);
}

TEST_CASE("A disarmed monitor never probes", "[liveness][monitor]")
{
    std::atomic<int> probes{0};
    HeartbeatMonitor monitor{"entry", 5ms, 1,
                             [&probes] {
                                 ++probes;
                                 return false;
                             },
                             {}, false};
    monitor.start();
    std::this_thread::sleep_for(50ms);

    REQUIRE(probes.load() == 0);
    REQUIRE(monitor.state() == LivenessState::Healthy);

    monitor.arm();
    REQUIRE(waitFor([&monitor] { return monitor.state() == LivenessState::Lost; }));
}

TEST_CASE("Stopping a monitor joins its thread promptly", "[liveness][monitor]")
{
    HeartbeatMonitor monitor{"b", 10s, 3, [] { return true; }, {}};
    monitor.start();

    const auto start = std::chrono::steady_clock::now();
    monitor.stop();
    REQUIRE(std::chrono::steady_clock::now() - start < 1s);
}

} // namespace hop::liveness
