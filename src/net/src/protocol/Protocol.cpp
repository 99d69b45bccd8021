/**
 * @file Protocol.cpp
 * @brief Frame header encoding and validation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/net/protocol/Protocol.hpp>
#include <hop/serial/ByteStream.hpp>

#include <format>

namespace hop::net::protocol {

std::string_view toString(MessageType type) noexcept
{
    switch (type)
    {
    case MessageType::MigrateRequest:  return "MigrateRequest";
    case MessageType::MigrateResponse: return "MigrateResponse";
    case MessageType::BaselineQuery:   return "BaselineQuery";
    case MessageType::BaselineReply:   return "BaselineReply";
    case MessageType::Heartbeat:       return "Heartbeat";
    case MessageType::HeartbeatAck:    return "HeartbeatAck";
    case MessageType::Shutdown:        return "Shutdown";
    case MessageType::ShutdownAck:     return "ShutdownAck";
    case MessageType::Error:           return "Error";
    }
    return "Unknown";
}

Frame makeFrame(MessageType type, core::Bytes payload, core::u32 sequence, core::u8 flags)
{
    Frame frame;
    frame.header.type        = type;
    frame.header.flags       = flags;
    frame.header.sequence    = sequence;
    frame.header.payloadSize = static_cast<core::u32>(payload.size());
    frame.payload            = std::move(payload);
    return frame;
}

core::Bytes encodeHeader(const FrameHeader &header)
{
    serial::ByteStream out;
    out.writeU32(header.magic);
    out.writeU8(header.version);
    out.writeU8(static_cast<core::u8>(header.type));
    out.writeU8(header.flags);
    out.writeU8(header.padding);
    out.writeU32(header.sequence);
    out.writeU32(header.payloadSize);
    return out.release();
}

core::Expected<FrameHeader> decodeHeader(std::span<const core::byte> bytes)
{
    if (bytes.size() < kFrameHeaderSize)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::format("frame header truncated ({} bytes)", bytes.size()));
    }

    serial::ByteStream in{bytes.first(kFrameHeaderSize)};
    FrameHeader header;
    header.magic = HOP_TRY(in.readU32());
    if (header.magic != kProtocolMagic)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::format("bad frame magic 0x{:08x}", header.magic));
    }
    header.version     = HOP_TRY(in.readU8());
    header.type        = static_cast<MessageType>(HOP_TRY(in.readU8()));
    header.flags       = HOP_TRY(in.readU8());
    header.padding     = HOP_TRY(in.readU8());
    header.sequence    = HOP_TRY(in.readU32());
    header.payloadSize = HOP_TRY(in.readU32());

    if (header.payloadSize > core::kMaxMessageSize)
    {
        return core::makeError(core::ErrorCode::kMessageTooLarge,
                               std::format("payload of {} bytes exceeds the {} byte limit",
                                           header.payloadSize, core::kMaxMessageSize));
    }
    return header;
}

core::Expected<core::Bytes> encodeFrame(const Frame &frame)
{
    if (frame.payload.size() > core::kMaxMessageSize)
    {
        return core::makeError(core::ErrorCode::kMessageTooLarge,
                               std::format("payload of {} bytes exceeds the {} byte limit",
                                           frame.payload.size(), core::kMaxMessageSize));
    }

    FrameHeader header = frame.header;
    header.payloadSize = static_cast<core::u32>(frame.payload.size());

    auto bytes = encodeHeader(header);
    bytes.insert(bytes.end(), frame.payload.begin(), frame.payload.end());
    return bytes;
}

core::Expected<Frame> decodeFrame(std::span<const core::byte> bytes)
{
    Frame frame;
    frame.header = HOP_TRY(decodeHeader(bytes));

    const auto body = bytes.subspan(kFrameHeaderSize);
    if (body.size() != frame.header.payloadSize)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::format("frame announces {} payload bytes, carries {}",
                                           frame.header.payloadSize, body.size()));
    }
    frame.payload.assign(body.begin(), body.end());
    return frame;
}

} // namespace hop::net::protocol
