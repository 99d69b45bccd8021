/**
 * @file Messages.cpp
 * @brief Encoding and validation of typed frame payloads.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/net/protocol/Messages.hpp>
#include <hop/serial/ByteStream.hpp>

#include <format>

namespace hop::net::protocol {

namespace {

constexpr core::usize kMaxTextSize = 4096;
constexpr core::u8    kResponse    = static_cast<core::u8>(FrameFlag::Response);

core::ExpectedVoid expectType(const Frame &frame, MessageType expected)
{
    if (frame.type() != expected)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::format("expected {} frame, got {}",
                                           toString(expected), toString(frame.type())));
    }
    return {};
}

core::ExpectedVoid expectConsumed(const serial::ByteStream &in, MessageType type)
{
    if (in.bytesRemaining() != 0)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("{} payload has {} trailing bytes",
                                           toString(type), in.bytesRemaining()));
    }
    return {};
}

} // namespace

std::string_view toString(RejectReason reason) noexcept
{
    switch (reason)
    {
    case RejectReason::None:                  return "none";
    case RejectReason::UnsupportedVersion:    return "unsupported scheme version";
    case RejectReason::MalformedPayload:      return "malformed payload";
    case RejectReason::NotHostedHere:         return "destination does not host the target";
    case RejectReason::ModuleMismatch:        return "module digest mismatch";
    case RejectReason::InsufficientResources: return "insufficient local resources";
    case RejectReason::BaselineMismatch:      return "baseline mismatch";
    case RejectReason::RestoreFailed:         return "restore failed";
    }
    return "unknown";
}

// ----- //  MigrationRequest  // ----- //

core::Expected<Frame> MigrationRequest::encode() const
{
    serial::ByteStream out;
    out.reserve(4 * 8 + 2 * 4 + source.size() + destination.size() + snapshot.serializedSize());
    out.writeU64(migrationId);
    out.writeString(source);
    out.writeString(destination);
    out.writeU64(moduleDigest);
    out.writeU64(nextBaselineId);
    HOP_TRY_VOID(snapshot.serialize(out));
    return makeFrame(MessageType::MigrateRequest, out.release());
}

core::Expected<MigrationRequest> MigrationRequest::decode(const Frame &frame)
{
    HOP_TRY_VOID(expectType(frame, MessageType::MigrateRequest));

    serial::ByteStream in{frame.payload};
    MigrationRequest req;
    req.migrationId    = HOP_TRY(in.readU64());
    req.source         = HOP_TRY(in.readString(kMaxTextSize));
    req.destination    = HOP_TRY(in.readString(kMaxTextSize));
    req.moduleDigest   = HOP_TRY(in.readU64());
    req.nextBaselineId = HOP_TRY(in.readU64());
    HOP_TRY_VOID(req.snapshot.deserialize(in));
    HOP_TRY_VOID(expectConsumed(in, MessageType::MigrateRequest));
    return req;
}

core::Expected<core::MigrationId> MigrationRequest::peekId(const Frame &frame)
{
    serial::ByteStream in{frame.payload};
    return in.readU64();
}

// ----- //  MigrationResponse  // ----- //

MigrationResponse MigrationResponse::acknowledged(core::MigrationId id)
{
    return MigrationResponse{id, MigrationStatus::Acknowledged, RejectReason::None, {}};
}

MigrationResponse MigrationResponse::rejected(core::MigrationId id, RejectReason reason, std::string detail)
{
    return MigrationResponse{id, MigrationStatus::Rejected, reason, std::move(detail)};
}

Frame MigrationResponse::encode() const
{
    serial::ByteStream out;
    out.writeU64(migrationId);
    out.writeU8(static_cast<core::u8>(status));
    out.writeU8(static_cast<core::u8>(reason));
    out.writeString(detail);
    return makeFrame(MessageType::MigrateResponse, out.release(), 0, kResponse);
}

core::Expected<MigrationResponse> MigrationResponse::decode(const Frame &frame)
{
    HOP_TRY_VOID(expectType(frame, MessageType::MigrateResponse));

    serial::ByteStream in{frame.payload};
    MigrationResponse resp;
    resp.migrationId = HOP_TRY(in.readU64());

    const auto status = HOP_TRY(in.readU8());
    const auto reason = HOP_TRY(in.readU8());
    if (status > static_cast<core::u8>(MigrationStatus::Rejected)
        || reason > static_cast<core::u8>(RejectReason::RestoreFailed))
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("invalid migration status {} / reason {}", status, reason));
    }
    resp.status = static_cast<MigrationStatus>(status);
    resp.reason = static_cast<RejectReason>(reason);
    resp.detail = HOP_TRY(in.readString(kMaxTextSize));
    HOP_TRY_VOID(expectConsumed(in, MessageType::MigrateResponse));
    return resp;
}

// ----- //  Baseline negotiation  // ----- //

Frame BaselineQuery::encode() const
{
    serial::ByteStream out;
    out.writeString(requester);
    return makeFrame(MessageType::BaselineQuery, out.release());
}

core::Expected<BaselineQuery> BaselineQuery::decode(const Frame &frame)
{
    HOP_TRY_VOID(expectType(frame, MessageType::BaselineQuery));

    serial::ByteStream in{frame.payload};
    BaselineQuery query;
    query.requester = HOP_TRY(in.readString(kMaxTextSize));
    HOP_TRY_VOID(expectConsumed(in, MessageType::BaselineQuery));
    return query;
}

Frame BaselineReply::encode() const
{
    serial::ByteStream out;
    out.writeBool(hasBaseline);
    out.writeU64(baselineId);
    return makeFrame(MessageType::BaselineReply, out.release(), 0, kResponse);
}

core::Expected<BaselineReply> BaselineReply::decode(const Frame &frame)
{
    HOP_TRY_VOID(expectType(frame, MessageType::BaselineReply));

    serial::ByteStream in{frame.payload};
    BaselineReply reply;
    reply.hasBaseline = HOP_TRY(in.readBool());
    reply.baselineId  = HOP_TRY(in.readU64());
    HOP_TRY_VOID(expectConsumed(in, MessageType::BaselineReply));
    return reply;
}

// ----- //  Liveness  // ----- //

Frame HeartbeatMessage::encode() const
{
    serial::ByteStream out;
    out.writeString(sender);
    out.writeU64(timestampMs);
    out.writeU64(sequence);
    out.writeBool(executionStarted);
    return makeFrame(MessageType::Heartbeat, out.release(), static_cast<core::u32>(sequence));
}

core::Expected<HeartbeatMessage> HeartbeatMessage::decode(const Frame &frame)
{
    HOP_TRY_VOID(expectType(frame, MessageType::Heartbeat));

    serial::ByteStream in{frame.payload};
    HeartbeatMessage hb;
    hb.sender           = HOP_TRY(in.readString(kMaxTextSize));
    hb.timestampMs      = HOP_TRY(in.readU64());
    hb.sequence         = HOP_TRY(in.readU64());
    hb.executionStarted = HOP_TRY(in.readBool());
    HOP_TRY_VOID(expectConsumed(in, MessageType::Heartbeat));
    return hb;
}

Frame HeartbeatAck::encode() const
{
    serial::ByteStream out;
    out.writeString(sender);
    out.writeU64(timestampMs);
    out.writeU64(sequence);
    return makeFrame(MessageType::HeartbeatAck, out.release(),
                     static_cast<core::u32>(sequence), kResponse);
}

core::Expected<HeartbeatAck> HeartbeatAck::decode(const Frame &frame)
{
    HOP_TRY_VOID(expectType(frame, MessageType::HeartbeatAck));

    serial::ByteStream in{frame.payload};
    HeartbeatAck ack;
    ack.sender      = HOP_TRY(in.readString(kMaxTextSize));
    ack.timestampMs = HOP_TRY(in.readU64());
    ack.sequence    = HOP_TRY(in.readU64());
    HOP_TRY_VOID(expectConsumed(in, MessageType::HeartbeatAck));
    return ack;
}

Frame ShutdownMessage::encode() const
{
    serial::ByteStream out;
    out.writeString(sender);
    out.writeString(reason);
    return makeFrame(MessageType::Shutdown, out.release());
}

core::Expected<ShutdownMessage> ShutdownMessage::decode(const Frame &frame)
{
    HOP_TRY_VOID(expectType(frame, MessageType::Shutdown));

    serial::ByteStream in{frame.payload};
    ShutdownMessage msg;
    msg.sender = HOP_TRY(in.readString(kMaxTextSize));
    msg.reason = HOP_TRY(in.readString(kMaxTextSize));
    HOP_TRY_VOID(expectConsumed(in, MessageType::Shutdown));
    return msg;
}

// ----- //  Errors  // ----- //

Frame ErrorMessage::encode() const
{
    serial::ByteStream out;
    out.writeU16(static_cast<core::u16>(code));
    out.writeString(message.size() > kMaxTextSize ? message.substr(0, kMaxTextSize) : message);
    return makeFrame(MessageType::Error, out.release(), 0, kResponse);
}

core::Expected<ErrorMessage> ErrorMessage::decode(const Frame &frame)
{
    HOP_TRY_VOID(expectType(frame, MessageType::Error));

    serial::ByteStream in{frame.payload};
    ErrorMessage msg;
    msg.code    = static_cast<core::ErrorCode>(HOP_TRY(in.readU16()));
    msg.message = HOP_TRY(in.readString(kMaxTextSize));
    return msg;
}

core::Error ErrorMessage::toError() const
{
    return core::Error{code, std::format("remote: {}", message)};
}

} // namespace hop::net::protocol
