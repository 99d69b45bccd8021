/**
 * @file TestSocketTransport.cpp
 * @brief TCP round trips through SocketTransport / SocketListener.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/net/Dispatcher.hpp"
#include "hop/net/protocol/Messages.hpp"
#include "hop/net/transport/SocketTransport.hpp"

namespace hop::net::transport {

using namespace std::chrono_literals;

TEST_CASE("SocketListener binds an ephemeral port", "[net][socket]")
{
    SocketListener listener{"127.0.0.1", 0, 2};
    REQUIRE(listener.open([](const protocol::Frame &frame) { return frame; }).has_value());

    REQUIRE(listener.endpoint().host == "127.0.0.1");
    REQUIRE(listener.endpoint().port != 0);

    const auto again = listener.open([](const protocol::Frame &frame) { return frame; });
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE("SocketListener rejects a malformed bind address", "[net][socket]")
{
    SocketListener listener{"not-an-address", 0, 1};
    const auto opened = listener.open([](const protocol::Frame &frame) { return frame; });
    REQUIRE_FALSE(opened.has_value());
    REQUIRE(opened.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(listener.endpoint().port == 0);
}

TEST_CASE("SocketTransport round-trips a heartbeat", "[net][socket]")
{
    Dispatcher dispatcher;
    dispatcher.on(protocol::MessageType::Heartbeat, [](const protocol::Frame &frame) -> core::Expected<protocol::Frame> {
        const auto hb = HOP_TRY(protocol::HeartbeatMessage::decode(frame));
        return protocol::HeartbeatAck{"node-b", hb.timestampMs, hb.sequence}.encode();
    });

    SocketListener listener{"127.0.0.1", 0, 2};
    REQUIRE(listener.open(dispatcher.asFrameHandler()).has_value());

    SocketTransport client;
    for (core::u64 seq = 1; seq <= 3; ++seq)
    {
        const auto reply = client.request(listener.endpoint(),
                                          protocol::HeartbeatMessage{"node-a", 1000, seq, true}.encode(), 2s);
        REQUIRE(reply.has_value());

        const auto ack = protocol::HeartbeatAck::decode(*reply);
        REQUIRE(ack.has_value());
        REQUIRE(ack->sender == "node-b");
        REQUIRE(ack->sequence == seq);
    }
}

TEST_CASE("SocketTransport carries a multi-page migration payload", "[net][socket]")
{
    SocketListener listener{"127.0.0.1", 0, 1};
    REQUIRE(listener.open([](const protocol::Frame &frame) {
        const auto req = protocol::MigrationRequest::decode(frame);
        if (!req)
            return protocol::ErrorMessage{req.error().code(), req.error().message()}.encode();
        return protocol::MigrationResponse::acknowledged(req->migrationId).encode();
    }).has_value());

    protocol::MigrationRequest req;
    req.migrationId = 31;
    req.source      = "node-a";
    req.destination = "node-b";
    req.snapshot    = serial::ExecutionSnapshot{{}, {}, serial::MemoryImage::full(core::Bytes(16 * core::kPageSize))};

    SocketTransport client;
    const auto reply = client.request(listener.endpoint(), req.encode().value(), 5s);
    REQUIRE(reply.has_value());
    REQUIRE(protocol::MigrationResponse::decode(*reply)->migrationId == 31);
}

TEST_CASE("SocketTransport reports a refused connection", "[net][socket]")
{
    Endpoint closed;
    {
        SocketListener listener{"127.0.0.1", 0, 1};
        REQUIRE(listener.open([](const protocol::Frame &frame) { return frame; }).has_value());
        closed = listener.endpoint();
    }

    SocketTransport client;
    const auto reply = client.request(closed, protocol::ShutdownMessage{"node-a", "x"}.encode(), 500ms);
    REQUIRE_FALSE(reply.has_value());
    REQUIRE(core::isRetryable(reply.error().code()));
}

} // namespace hop::net::transport
