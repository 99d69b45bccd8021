/**
 * @file TestMigrationCoordinator.cpp
 * @brief Two-node migration scenarios over the loopback network.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/migration/InMemoryHost.hpp"
#include "hop/migration/MigrationCoordinator.hpp"
#include "hop/net/transport/LoopbackTransport.hpp"
#include "hop/core/Constants.hpp"

#include <atomic>
#include <thread>

namespace hop::migration {

namespace {

using namespace std::chrono_literals;

constexpr core::u64 kDigest = 0xC0FFEE;
constexpr core::usize kPage = core::kPageSize;

cluster::ClusterConfig::Builder baseConfig()
{
    cluster::ClusterConfig::Builder builder;
    builder.name("test")
        .addNode("a", "loop", 1)
        .addNode("b", "loop", 2)
        .retry(cluster::RetrySettings{3, 1ms, 2ms, 500ms});
    return builder;
}

/// Two coordinators wired through one loopback network.
struct TwoNodes
{
    cluster::ClusterConfig                           config;
    std::shared_ptr<net::transport::LoopbackNetwork> network = std::make_shared<net::transport::LoopbackNetwork>();

    InMemoryHost hostA{kDigest, 2};
    InMemoryHost hostB{kDigest, 2};

    net::PeerClient peersA{config.nodes(), std::make_shared<net::transport::LoopbackTransport>(network)};
    net::PeerClient peersB{config.nodes(), std::make_shared<net::transport::LoopbackTransport>(network)};

    MigrationCoordinator a{"a", config, hostA, peersA};
    MigrationCoordinator b{"b", config, hostB, peersB};

    net::Dispatcher dispatchA;
    net::Dispatcher dispatchB;

    net::transport::LoopbackListener listenA{network, {"loop", 1}};
    net::transport::LoopbackListener listenB{network, {"loop", 2}};

    explicit TwoNodes(cluster::ClusterConfig cfg) : config(std::move(cfg))
    {
        a.registerHandlers(dispatchA);
        b.registerHandlers(dispatchB);
        REQUIRE(listenA.open(dispatchA.asFrameHandler()).has_value());
        REQUIRE(listenB.open(dispatchB.asFrameHandler()).has_value());
    }

    TwoNodes() : TwoNodes(baseConfig().build().value()) {}
};

void fill(InMemoryHost &host, core::usize page, core::u8 value)
{
    const core::Bytes bytes(kPage, core::byte{value});
    REQUIRE(host.writeMemory(page * kPage, bytes).has_value());
}

net::protocol::MigrationRequest requestFor(InMemoryHost &host, core::MigrationId id)
{
    net::protocol::MigrationRequest req;
    req.migrationId    = id;
    req.source         = "a";
    req.destination    = "b";
    req.moduleDigest   = kDigest;
    req.nextBaselineId = id;
    req.snapshot       = host.capture().value();
    return req;
}

} // namespace

TEST_CASE("Migrating to the current node is a no-op", "[migration][coordinator]")
{
    TwoNodes nodes;

    const auto outcome = nodes.a.migrateTo("a");
    REQUIRE(outcome.value() == MigrationOutcome::StayedLocal);
    REQUIRE(nodes.a.sourceState() == SourceState::Idle);
    REQUIRE(nodes.network->requestCount({"loop", 2}) == 0);
}

TEST_CASE("Full transfer then a one-page delta", "[migration][coordinator][e2e]")
{
    TwoNodes nodes;
    fill(nodes.hostA, 0, 0x11);
    fill(nodes.hostA, 1, 0x22);
    nodes.hostA.setGlobals({serial::GlobalValue::i32(7), serial::GlobalValue::f64(2.5)});

    REQUIRE(nodes.a.hostsExecution());
    REQUIRE_FALSE(nodes.b.hostsExecution());

    const auto first = nodes.a.migrateTo("b");
    REQUIRE(first.value() == MigrationOutcome::AwaitingReturn);
    REQUIRE(nodes.a.sourceState() == SourceState::Completed);
    REQUIRE(nodes.b.destinationState() == DestinationState::Resumed);
    REQUIRE(nodes.hostB.memory() == nodes.hostA.memory());
    REQUIRE(nodes.hostB.globals() == nodes.hostA.globals());
    REQUIRE(nodes.hostB.running());
    REQUIRE(nodes.b.hostsExecution());
    REQUIRE_FALSE(nodes.a.hostsExecution());
    REQUIRE(nodes.a.stats().fullImagesSent == 1);

    // Both sides now agree on the transferred image.
    const auto baselineA = nodes.a.baselines().find("b");
    const auto baselineB = nodes.b.baselines().find("a");
    REQUIRE(baselineA.has_value());
    REQUIRE(baselineB.has_value());
    REQUIRE(baselineA->baselineId == baselineB->baselineId);

    // Execution on b touches one page and returns.
    fill(nodes.hostB, 1, 0x33);
    const auto back = nodes.b.migrateTo("a");
    REQUIRE(back.value() == MigrationOutcome::AwaitingReturn);

    const auto stats = nodes.b.stats();
    REQUIRE(stats.deltaImagesSent == 1);
    REQUIRE(stats.pagesSent == 1);
    REQUIRE(nodes.hostA.memory() == nodes.hostB.memory());
    REQUIRE(nodes.a.hostsExecution());
    REQUIRE(nodes.hostA.restoreCount() == 1);
}

TEST_CASE("A retried migration is acknowledged without restoring again", "[migration][coordinator]")
{
    TwoNodes nodes;
    fill(nodes.hostA, 0, 0x5A);

    const auto first = nodes.b.handleMigrate(requestFor(nodes.hostA, 77));
    const auto second = nodes.b.handleMigrate(requestFor(nodes.hostA, 77));

    REQUIRE(first.isAcknowledged());
    REQUIRE(second == first);
    REQUIRE(nodes.hostB.restoreCount() == 1);
    REQUIRE(nodes.b.stats().duplicatesReplayed == 1);
}

TEST_CASE("Unknown baseline is rejected and the source falls back to a full image", "[migration][coordinator]")
{
    TwoNodes nodes;
    fill(nodes.hostA, 0, 0x01);
    REQUIRE(nodes.a.migrateTo("b").has_value());

    SECTION("destination rejects a delta it cannot apply")
    {
        auto req = requestFor(nodes.hostA, 500);
        req.snapshot = std::move(req.snapshot).withMemory(serial::MemoryImage::delta(12345, 2, {}));

        const auto resp = nodes.b.handleMigrate(std::move(req));
        REQUIRE_FALSE(resp.isAcknowledged());
        REQUIRE(resp.reason == net::protocol::RejectReason::BaselineMismatch);
    }

    SECTION("source resends the same migration in full")
    {
        // b lost its baseline but a stale reply still advertises it.
        const auto advertised = nodes.a.baselines().find("b")->baselineId;
        nodes.b.forgetPeer("a");
        nodes.dispatchB.on(net::protocol::MessageType::BaselineQuery,
                           [advertised](const net::protocol::Frame &) -> core::Expected<net::protocol::Frame> {
                               return net::protocol::BaselineReply{true, advertised}.encode();
                           });

        fill(nodes.hostA, 1, 0x02);
        const auto outcome = nodes.a.migrateTo("b");
        REQUIRE(outcome.has_value());
        REQUIRE(nodes.a.stats().fullImagesSent == 2);
        REQUIRE(nodes.a.stats().deltaImagesSent == 0);
        REQUIRE(nodes.hostB.memory() == nodes.hostA.memory());
        REQUIRE(nodes.hostB.restoreCount() == 2);
    }
}

TEST_CASE("Destination-side validation rejects bad migrations", "[migration][coordinator]")
{
    SECTION("module mismatch")
    {
        TwoNodes nodes;
        auto req = requestFor(nodes.hostA, 1);
        req.moduleDigest = kDigest + 1;
        REQUIRE(nodes.b.handleMigrate(std::move(req)).reason == net::protocol::RejectReason::ModuleMismatch);
    }

    SECTION("wrong destination")
    {
        TwoNodes nodes;
        auto req = requestFor(nodes.hostA, 2);
        req.destination = "a";
        REQUIRE(nodes.b.handleMigrate(std::move(req)).reason == net::protocol::RejectReason::NotHostedHere);
    }

    SECTION("too many pages")
    {
        TwoNodes nodes{baseConfig().maxMemoryPages(1).build().value()};
        const auto resp = nodes.b.handleMigrate(requestFor(nodes.hostA, 3));
        REQUIRE(resp.reason == net::protocol::RejectReason::InsufficientResources);
        REQUIRE(nodes.hostB.restoreCount() == 0);
    }

    SECTION("restore failure is reported to the source")
    {
        TwoNodes nodes;
        nodes.hostB.failNextRestore("no room");

        const auto outcome = nodes.a.migrateTo("b");
        REQUIRE_FALSE(outcome.has_value());
        REQUIRE(outcome.error().code() == core::ErrorCode::kMigrationRejected);
        REQUIRE(nodes.a.sourceState() == SourceState::Failed);
        REQUIRE_FALSE(nodes.b.hostsExecution());
        REQUIRE_FALSE(nodes.b.baselines().find("a").has_value());
    }
}

TEST_CASE("A silent destination fails the migration in bounded time", "[migration][coordinator]")
{
    TwoNodes nodes{baseConfig().memoryStrategy(cluster::MemoryStrategy::Full)
                       .retry(cluster::RetrySettings{3, 1ms, 2ms, 20ms})
                       .build()
                       .value()};
    nodes.network->setBlackhole({"loop", 2}, true);

    const auto start = std::chrono::steady_clock::now();
    const auto outcome = nodes.a.migrateTo("b");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(outcome.error().code() == core::ErrorCode::kTransportFailure);
    REQUIRE(nodes.a.sourceState() == SourceState::Failed);
    REQUIRE(nodes.a.hostsExecution());
    REQUIRE(elapsed < 2s);
}

TEST_CASE("Call chain brings the execution back to the caller", "[migration][coordinator][callchain]")
{
    TwoNodes nodes;

    REQUIRE(nodes.a.enterFunction("a", 1).value() == MigrationOutcome::StayedLocal);

    REQUIRE(nodes.a.enterFunction("b", 3).value() == MigrationOutcome::AwaitingReturn);
    REQUIRE(nodes.a.callChain().empty());
    REQUIRE(nodes.b.callChain().size() == 1);
    REQUIRE(nodes.b.callChain().front().fromNode == "a");

    // A nested exit at another height stays on b.
    REQUIRE(nodes.b.exitFunction(5).value() == MigrationOutcome::StayedLocal);

    REQUIRE(nodes.b.exitFunction(3).value() == MigrationOutcome::AwaitingReturn);
    REQUIRE(nodes.a.hostsExecution());
    REQUIRE(nodes.a.callChain().empty());
}

TEST_CASE("Execution that returns before the ack keeps its chain and baseline", "[migration][coordinator][callchain]")
{
    TwoNodes nodes;
    fill(nodes.hostA, 0, 0x44);

    // b resumes, calls back into a on its own thread, and only then acks.
    std::thread       nested;
    std::atomic<bool> once{false};
    core::Expected<MigrationOutcome> nestedOutcome = MigrationOutcome::StayedLocal;
    nodes.hostB.onResume([&] {
        if (once.exchange(true))
            return;
        nested = std::thread{[&] { nestedOutcome = nodes.b.enterFunction("a", 2); }};
        std::this_thread::sleep_for(100ms);
    });

    const auto outcome = nodes.a.enterFunction("b", 1);
    nested.join();

    REQUIRE(outcome.value() == MigrationOutcome::AwaitingReturn);
    REQUIRE(nestedOutcome.value() == MigrationOutcome::AwaitingReturn);

    REQUIRE(nodes.a.hostsExecution());
    REQUIRE_FALSE(nodes.b.hostsExecution());

    const auto chain = nodes.a.callChain();
    REQUIRE(chain.size() == 2);
    REQUIRE(chain[0].fromNode == "a");
    REQUIRE(chain[1].fromNode == "b");

    const auto baselineA = nodes.a.baselines().find("b");
    const auto baselineB = nodes.b.baselines().find("a");
    REQUIRE(baselineA.has_value());
    REQUIRE(baselineB.has_value());
    REQUIRE(baselineA->baselineId == baselineB->baselineId);

    // Leaving the nested function still returns to b.
    REQUIRE(nodes.a.exitFunction(2).value() == MigrationOutcome::AwaitingReturn);
    REQUIRE(nodes.b.hostsExecution());
    REQUIRE(nodes.hostB.memory() == nodes.hostA.memory());
}

TEST_CASE("Move semantics terminate the source execution", "[migration][coordinator]")
{
    TwoNodes nodes{baseConfig().returnSemantics(cluster::ReturnSemantics::Move).build().value()};
    REQUIRE(nodes.a.migrateTo("b").value() == MigrationOutcome::Terminated);
    REQUIRE(nodes.b.hostsExecution());
}

TEST_CASE("Unknown targets fail without contacting the network", "[migration][coordinator]")
{
    TwoNodes nodes;
    const auto outcome = nodes.a.migrateTo("nowhere");
    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(outcome.error().code() == core::ErrorCode::kInvalidArgument);
}

} // namespace hop::migration
