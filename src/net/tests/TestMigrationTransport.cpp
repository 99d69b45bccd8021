/**
 * @file TestMigrationTransport.cpp
 * @brief Retry behaviour of net::MigrationTransport over the loopback network.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/net/MigrationTransport.hpp"
#include "hop/net/transport/LoopbackTransport.hpp"

#include <atomic>

namespace hop::net {

namespace {

using namespace std::chrono_literals;

const transport::Endpoint kEndpointB{"loop", 2};

cluster::NodeTable makeTable()
{
    return cluster::NodeTable::create({
                                          {"node-a", "loop", 1, std::nullopt},
                                          {"node-b", "loop", 2, std::nullopt},
                                      })
        .value();
}

protocol::MigrationRequest makeRequest(core::MigrationId id)
{
    protocol::MigrationRequest req;
    req.migrationId = id;
    req.source      = "node-a";
    req.destination = "node-b";
    req.snapshot    = serial::ExecutionSnapshot{{}, {}, serial::MemoryImage::full(core::Bytes(core::kPageSize))};
    return req;
}

cluster::RetrySettings fastRetry()
{
    return cluster::RetrySettings{5, 2ms, 10ms, 50ms};
}

} // namespace

TEST_CASE("Backoff doubles up to the cap", "[net][retry]")
{
    const cluster::RetrySettings retry{};
    REQUIRE(MigrationTransport::backoffAfter(retry, 1) == 200ms);
    REQUIRE(MigrationTransport::backoffAfter(retry, 2) == 400ms);
    REQUIRE(MigrationTransport::backoffAfter(retry, 3) == 800ms);
    REQUIRE(MigrationTransport::backoffAfter(retry, 4) == 1600ms);
    REQUIRE(MigrationTransport::backoffAfter(retry, 5) == 2000ms);
    REQUIRE(MigrationTransport::backoffAfter(retry, 9) == 2000ms);
}

TEST_CASE("A reachable destination answers on the first attempt", "[net][retry]")
{
    auto network = std::make_shared<transport::LoopbackNetwork>();
    const auto table = makeTable();
    PeerClient peers{table, std::make_shared<transport::LoopbackTransport>(network)};

    transport::LoopbackListener listener{network, kEndpointB};
    REQUIRE(listener.open([](const protocol::Frame &frame) {
        const auto id = protocol::MigrationRequest::peekId(frame).value();
        return protocol::MigrationResponse::acknowledged(id).encode();
    }).has_value());

    const MigrationTransport transport{peers, fastRetry()};
    const auto resp = transport.send(makeRequest(9));
    REQUIRE(resp.has_value());
    REQUIRE(resp->isAcknowledged());
    REQUIRE(resp->migrationId == 9);
    REQUIRE(network->requestCount(kEndpointB) == 1);
}

TEST_CASE("An unreachable destination exhausts the retry budget", "[net][retry]")
{
    auto network = std::make_shared<transport::LoopbackNetwork>();
    const auto table = makeTable();
    PeerClient peers{table, std::make_shared<transport::LoopbackTransport>(network)};
    network->setReachable(kEndpointB, false);

    const MigrationTransport transport{peers, fastRetry()};
    const auto start = std::chrono::steady_clock::now();
    const auto resp = transport.send(makeRequest(1));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().code() == core::ErrorCode::kTransportFailure);
    REQUIRE(network->requestCount(kEndpointB) == 5);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("A silent destination times out on every attempt", "[net][retry]")
{
    auto network = std::make_shared<transport::LoopbackNetwork>();
    const auto table = makeTable();
    PeerClient peers{table, std::make_shared<transport::LoopbackTransport>(network)};
    network->setBlackhole(kEndpointB, true);

    const MigrationTransport transport{peers, cluster::RetrySettings{3, 1ms, 1ms, 20ms}};
    const auto resp = transport.send(makeRequest(2));

    REQUIRE_FALSE(resp.has_value());
    REQUIRE(resp.error().code() == core::ErrorCode::kTransportFailure);
    REQUIRE(network->requestCount(kEndpointB) == 3);
}

TEST_CASE("Rejections and remote errors are not retried", "[net][retry]")
{
    auto network = std::make_shared<transport::LoopbackNetwork>();
    const auto table = makeTable();
    PeerClient peers{table, std::make_shared<transport::LoopbackTransport>(network)};
    const MigrationTransport transport{peers, fastRetry()};
    transport::LoopbackListener listener{network, kEndpointB};

    SECTION("rejected")
    {
        REQUIRE(listener.open([](const protocol::Frame &frame) {
            const auto id = protocol::MigrationRequest::peekId(frame).value();
            return protocol::MigrationResponse::rejected(id, protocol::RejectReason::ModuleMismatch, "x").encode();
        }).has_value());

        const auto resp = transport.send(makeRequest(3));
        REQUIRE(resp.has_value());
        REQUIRE(resp->reason == protocol::RejectReason::ModuleMismatch);
    }

    SECTION("remote error")
    {
        REQUIRE(listener.open([](const protocol::Frame &) {
            return protocol::ErrorMessage{core::ErrorCode::kRestoreFailure, "host refused"}.encode();
        }).has_value());

        const auto resp = transport.send(makeRequest(4));
        REQUIRE_FALSE(resp.has_value());
        REQUIRE(resp.error().code() == core::ErrorCode::kRestoreFailure);
    }

    REQUIRE(network->requestCount(kEndpointB) == 1);
}

TEST_CASE("A transient outage is absorbed by the retries", "[net][retry]")
{
    auto network = std::make_shared<transport::LoopbackNetwork>();
    const auto table = makeTable();
    PeerClient peers{table, std::make_shared<transport::LoopbackTransport>(network)};

    std::atomic<int> calls{0};
    transport::LoopbackListener listener{network, kEndpointB};
    REQUIRE(listener.open([&calls](const protocol::Frame &frame) {
        if (calls.fetch_add(1) < 2)
            return protocol::ErrorMessage{core::ErrorCode::kNetworkDisconnected, "reset"}.encode();
        const auto id = protocol::MigrationRequest::peekId(frame).value();
        return protocol::MigrationResponse::acknowledged(id).encode();
    }).has_value());

    const MigrationTransport transport{peers, fastRetry()};
    const auto resp = transport.send(makeRequest(5));
    REQUIRE(resp.has_value());
    REQUIRE(resp->isAcknowledged());
    REQUIRE(network->requestCount(kEndpointB) == 3);
}

} // namespace hop::net
