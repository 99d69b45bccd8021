/**
 * @file TestNode.cpp
 * @brief Node lifecycle scenarios over the loopback network.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/node/Node.hpp"
#include "hop/migration/InMemoryHost.hpp"
#include "hop/net/transport/LoopbackTransport.hpp"
#include "hop/core/Constants.hpp"

#include <thread>

namespace hop::node {

namespace {

using namespace std::chrono_literals;

constexpr core::u64 kDigest = 0xFEED;

cluster::ClusterConfig::Builder baseConfig()
{
    cluster::ClusterConfig::Builder builder;
    builder.name("node-test")
        .addNode("a", "loop", 1)
        .addNode("b", "loop", 2)
        .heartbeatInterval(20ms)
        .missThreshold(5)
        .readinessTimeout(500ms)
        .retry(cluster::RetrySettings{2, 1ms, 2ms, 200ms});
    return builder;
}

std::unique_ptr<Node> loopbackNode(const core::NodeId &id,
                                   const cluster::ClusterConfig &config,
                                   migration::IExecutionHost &host,
                                   const std::shared_ptr<net::transport::LoopbackNetwork> &network)
{
    const auto node = config.nodes().find(id);
    const net::transport::Endpoint endpoint{node ? node->address : "loop", node ? node->port : core::u16{0}};
    return std::make_unique<Node>(id, config, host, std::make_shared<net::transport::LoopbackTransport>(network),
                                  std::make_unique<net::transport::LoopbackListener>(network, endpoint));
}

/// Follower "b" initialised before entry "a", as a launcher would do.
struct Pair
{
    cluster::ClusterConfig                           config;
    std::shared_ptr<net::transport::LoopbackNetwork> network = std::make_shared<net::transport::LoopbackNetwork>();

    migration::InMemoryHost hostA{kDigest, 2};
    migration::InMemoryHost hostB{kDigest, 2};

    std::unique_ptr<Node> b = loopbackNode("b", config, hostB, network);
    std::unique_ptr<Node> a = loopbackNode("a", config, hostA, network);

    explicit Pair(cluster::ClusterConfig cfg) : config(std::move(cfg))
    {
        REQUIRE(b->init().has_value());
        REQUIRE(a->init().has_value());
    }

    Pair() : Pair(baseConfig().build().value()) {}
};

} // namespace

TEST_CASE("A node missing from the table refuses to start", "[node]")
{
    const auto config = baseConfig().build().value();
    auto network = std::make_shared<net::transport::LoopbackNetwork>();
    migration::InMemoryHost host{kDigest};

    auto node = loopbackNode("ghost", config, host, network);
    const auto result = node->init();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kNotFound);
}

TEST_CASE("Entry node waits for its peers before starting", "[node]")
{
    const auto config = baseConfig().readinessTimeout(100ms).build().value();
    auto network = std::make_shared<net::transport::LoopbackNetwork>();
    migration::InMemoryHost host{kDigest};

    auto a = loopbackNode("a", config, host, network);
    const auto result = a->init();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kTimeout);
}

TEST_CASE("Execution travels to the follower and back", "[node][e2e]")
{
    Pair pair;
    REQUIRE(pair.a->isEntry());
    REQUIRE_FALSE(pair.b->isEntry());

    const core::Bytes page(core::kPageSize, core::byte{0x42});
    REQUIRE(pair.hostA.writeMemory(0, page).has_value());

    pair.a->startExecution();
    REQUIRE(pair.a->migrateTo("b").value() == migration::MigrationOutcome::AwaitingReturn);
    REQUIRE(pair.hostB.memory() == pair.hostA.memory());

    const core::Bytes changed(core::kPageSize, core::byte{0x43});
    REQUIRE(pair.hostB.writeMemory(core::kPageSize, changed).has_value());
    REQUIRE(pair.b->migrateTo("a").value() == migration::MigrationOutcome::AwaitingReturn);

    REQUIRE(pair.hostA.memory() == pair.hostB.memory());
    REQUIRE(pair.b->coordinator().stats().deltaImagesSent == 1);
    REQUIRE_FALSE(pair.a->shutdownRequested());
    REQUIRE_FALSE(pair.b->shutdownRequested());
}

TEST_CASE("Program completion stops every node", "[node]")
{
    Pair pair;

    std::thread follower{[&pair] { pair.b->run(); }};
    pair.a->programFinished();
    follower.join();

    REQUIRE(pair.a->shutdownRequested());
    REQUIRE(pair.b->shutdownRequested());
    REQUIRE(pair.b->shutdownReason().find("program finished") != std::string::npos);
}

TEST_CASE("A failed migration is fatal for the source node", "[node]")
{
    Pair pair{baseConfig().peerMonitoring(false).build().value()};
    pair.network->setReachable({"loop", 2}, false);

    const auto outcome = pair.a->migrateTo("b");
    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(outcome.error().code() == core::ErrorCode::kTransportFailure);
    REQUIRE(pair.a->shutdownRequested());
    REQUIRE(pair.a->shutdownReason().find("migration failed") != std::string::npos);
}

TEST_CASE("A follower stops when the entry node disappears", "[node]")
{
    Pair pair;
    pair.a->startExecution();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (pair.b->liveness().heartbeatsReceived() < 3 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    REQUIRE(pair.b->liveness().heartbeatsReceived() >= 3);

    pair.a->shutdown();

    REQUIRE(pair.b->waitForShutdown(3s));
    REQUIRE(pair.b->shutdownReason().find("coordinator") != std::string::npos);
}

} // namespace hop::node
