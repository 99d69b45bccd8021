/**
 * @file TestProtocol.cpp
 * @brief Unit tests for frame headers and typed messages.
 */

#include <catch2/catch_test_macros.hpp>

#include "hop/net/protocol/Messages.hpp"
#include "hop/serial/ByteStream.hpp"

namespace hop::net::protocol {

TEST_CASE("Frame header survives encode/decode", "[net][protocol]")
{
    const auto frame = makeFrame(MessageType::Heartbeat, core::Bytes(12, core::byte{0xAB}), 7,
                                 static_cast<core::u8>(FrameFlag::Response));

    const auto bytes = encodeFrame(frame);
    REQUIRE(bytes.has_value());
    REQUIRE(bytes->size() == kFrameHeaderSize + 12);

    const auto decoded = decodeFrame(*bytes);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->type() == MessageType::Heartbeat);
    REQUIRE(decoded->header.sequence == 7);
    REQUIRE(hasFlag(decoded->header.flags, FrameFlag::Response));
    REQUIRE(decoded->payload == frame.payload);
}

TEST_CASE("decodeHeader rejects a bad magic", "[net][protocol]")
{
    auto header = FrameHeader{};
    header.magic = 0xDEADBEEF;
    const auto bytes = encodeHeader(header);

    const auto decoded = decodeHeader(bytes);
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kProtocolViolation);
}

TEST_CASE("decodeHeader rejects payloads above the message limit", "[net][protocol]")
{
    auto header = FrameHeader{};
    header.type = MessageType::MigrateRequest;
    header.payloadSize = static_cast<core::u32>(core::kMaxMessageSize + 1);

    const auto decoded = decodeHeader(encodeHeader(header));
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kMessageTooLarge);
}

TEST_CASE("MigrationRequest carries its snapshot", "[net][protocol]")
{
    MigrationRequest req;
    req.migrationId    = 0x1234;
    req.source         = "node-a";
    req.destination    = "node-b";
    req.moduleDigest   = 99;
    req.nextBaselineId = 5;
    req.snapshot = serial::ExecutionSnapshot{core::Bytes{core::byte{1}, core::byte{2}},
                                             {serial::GlobalValue::i32(-3)},
                                             serial::MemoryImage::full(core::Bytes(core::kPageSize)),
                                             {serial::CallFrame{"node-a", 2}}};

    const auto frame = req.encode();
    REQUIRE(frame.has_value());
    REQUIRE(MigrationRequest::peekId(*frame).value() == 0x1234);

    const auto decoded = MigrationRequest::decode(*frame);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->source == "node-a");
    REQUIRE(decoded->destination == "node-b");
    REQUIRE(decoded->moduleDigest == 99);
    REQUIRE(decoded->nextBaselineId == 5);
    REQUIRE(decoded->snapshot.hash() == req.snapshot.hash());
    REQUIRE(decoded->snapshot.callChain().front().stackHeight == 2);
}

TEST_CASE("MigrationResponse keeps status and reason", "[net][protocol]")
{
    const auto resp = MigrationResponse::rejected(77, RejectReason::ModuleMismatch, "digest differs");
    const auto frame = resp.encode();
    REQUIRE(hasFlag(frame.header.flags, FrameFlag::Response));

    const auto decoded = MigrationResponse::decode(frame);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == resp);
    REQUIRE_FALSE(decoded->isAcknowledged());
}

TEST_CASE("Decoders refuse frames of another type", "[net][protocol]")
{
    const auto frame = HeartbeatAck{"node-b", 1, 2}.encode();

    const auto decoded = HeartbeatMessage::decode(frame);
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kProtocolViolation);
}

TEST_CASE("Decoders refuse trailing bytes", "[net][protocol]")
{
    auto frame = BaselineReply{true, 3}.encode();
    frame.payload.push_back(core::byte{0});

    const auto decoded = BaselineReply::decode(frame);
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kDeserializationFailed);
}

TEST_CASE("ErrorMessage converts back to the remote error", "[net][protocol]")
{
    const auto frame = ErrorMessage{core::ErrorCode::kNotFound, "no such node"}.encode();
    const auto decoded = ErrorMessage::decode(frame);
    REQUIRE(decoded.has_value());

    const auto err = decoded->toError();
    REQUIRE(err.code() == core::ErrorCode::kNotFound);
    REQUIRE(err.message() == "remote: no such node");
}

} // namespace hop::net::protocol
