/**
 * @file TestDispatcher.cpp
 * @brief Unit tests for net::Dispatcher.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/net/Dispatcher.hpp"
#include "hop/net/protocol/Messages.hpp"

namespace hop::net {

using protocol::MessageType;

TEST_CASE("Dispatcher routes by message type", "[net][dispatcher]")
{
    Dispatcher dispatcher;
    dispatcher.on(MessageType::BaselineQuery, [](const protocol::Frame &frame) -> core::Expected<protocol::Frame> {
        const auto query = HOP_TRY(protocol::BaselineQuery::decode(frame));
        return protocol::BaselineReply{query.requester == "node-a", 11}.encode();
    });

    REQUIRE(dispatcher.handles(MessageType::BaselineQuery));
    REQUIRE_FALSE(dispatcher.handles(MessageType::Heartbeat));

    const auto reply = dispatcher.dispatch(protocol::BaselineQuery{"node-a"}.encode());
    const auto decoded = protocol::BaselineReply::decode(reply);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->hasBaseline);
    REQUIRE(decoded->baselineId == 11);
}

TEST_CASE("Dispatcher answers unknown types with an error frame", "[net][dispatcher]")
{
    Dispatcher dispatcher;
    const auto reply = dispatcher.dispatch(protocol::HeartbeatMessage{"node-a", 0, 1, false}.encode());

    REQUIRE(reply.type() == MessageType::Error);
    REQUIRE(protocol::ErrorMessage::decode(reply)->code == core::ErrorCode::kNotSupported);
}

TEST_CASE("Dispatcher turns handler failures into error frames", "[net][dispatcher]")
{
    Dispatcher dispatcher;
    dispatcher.on(MessageType::Shutdown, [](const protocol::Frame &) -> core::Expected<protocol::Frame> {
        return core::makeError(core::ErrorCode::kInvalidState, "already stopping");
    });

    const auto reply = dispatcher.dispatch(protocol::ShutdownMessage{"node-a", "done"}.encode());
    REQUIRE(reply.type() == MessageType::Error);

    const auto err = protocol::ErrorMessage::decode(reply);
    REQUIRE(err->code == core::ErrorCode::kInvalidState);
    REQUIRE(err->message == "already stopping");
}

TEST_CASE("Dispatcher rejects migrations of an unknown scheme version", "[net][dispatcher]")
{
    bool called = false;
    Dispatcher dispatcher;
    dispatcher.on(MessageType::MigrateRequest, [&called](const protocol::Frame &) -> core::Expected<protocol::Frame> {
        called = true;
        return protocol::MigrationResponse::acknowledged(0).encode();
    });

    protocol::MigrationRequest req;
    req.migrationId = 0xABCD;
    req.source      = "node-a";
    req.destination = "node-b";
    req.snapshot    = serial::ExecutionSnapshot{{}, {}, serial::MemoryImage::full(core::Bytes(core::kPageSize))};

    auto frame = req.encode().value();
    frame.header.version = protocol::kProtocolVersion + 1;

    const auto reply = protocol::MigrationResponse::decode(dispatcher.dispatch(frame));
    REQUIRE(reply.has_value());
    REQUIRE_FALSE(called);
    REQUIRE(reply->migrationId == 0xABCD);
    REQUIRE(reply->reason == protocol::RejectReason::UnsupportedVersion);
}

} // namespace hop::net
