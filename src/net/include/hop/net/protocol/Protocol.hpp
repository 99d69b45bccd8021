/**
 * @file Protocol.hpp
 * @brief Wire protocol constants, message types, and frame layout.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_NET_PROTOCOL_PROTOCOL_HPP
    #define HOP_NET_PROTOCOL_PROTOCOL_HPP

#include <hop/core/Constants.hpp>
#include <hop/core/Expected.hpp>
#include <hop/core/Types.hpp>

#include <span>
#include <string_view>

namespace hop::net::protocol {

/**
 * @brief Magic bytes identifying hop frames on the wire ("HOP\0").
 */
static constexpr core::u32 kProtocolMagic = 0x484F5000;

/** @brief Current migration scheme version. */
static constexpr core::u8 kProtocolVersion = 1;

/** @brief Size of the encoded FrameHeader. */
static constexpr core::usize kFrameHeaderSize = 16;

/**
 * @enum MessageType
 * @brief Exhaustive list of messages exchanged between nodes.
 */
enum class MessageType : core::u8
{
    MigrateRequest  = 0x10,
    MigrateResponse = 0x11,
    BaselineQuery   = 0x12,
    BaselineReply   = 0x13,
    Heartbeat       = 0x20,
    HeartbeatAck    = 0x21,
    Shutdown        = 0x30,
    ShutdownAck     = 0x31,
    Error           = 0x7F
};

[[nodiscard]] std::string_view toString(MessageType type) noexcept;

/**
 * @struct FrameHeader
 * @brief Fixed-size header prepended to every frame.
 *
 * Layout (16 bytes, little-endian):
 *   [magic:4][version:1][type:1][flags:1][pad:1][seq:4][payloadSize:4]
 */
struct FrameHeader
{
    core::u32   magic{kProtocolMagic};
    core::u8    version{kProtocolVersion};
    MessageType type{MessageType::Error};
    core::u8    flags{0};
    core::u8    padding{0};
    core::u32   sequence{0};
    core::u32   payloadSize{0};
};

/**
 * @enum FrameFlag
 * @brief Bit-flags stored in FrameHeader::flags.
 */
enum class FrameFlag : core::u8
{
    None     = 0x00,
    Response = 0x01
};

[[nodiscard]] inline constexpr core::u8 operator|(FrameFlag a, FrameFlag b) noexcept
{
    return static_cast<core::u8>(static_cast<core::u8>(a) | static_cast<core::u8>(b));
}

[[nodiscard]] inline constexpr bool hasFlag(core::u8 flags, FrameFlag f) noexcept
{
    return (flags & static_cast<core::u8>(f)) != 0;
}

/**
 * @struct Frame
 * @brief A decoded header plus its payload.
 */
struct Frame
{
    FrameHeader header{};
    core::Bytes payload;

    [[nodiscard]] MessageType type() const noexcept { return header.type; }
};

/**
 * @brief Builds a frame of @p type around @p payload.
 */
[[nodiscard]] Frame makeFrame(MessageType type, core::Bytes payload,
                              core::u32 sequence = 0, core::u8 flags = 0);

/**
 * @brief Serializes the 16-byte header.
 */
[[nodiscard]] core::Bytes encodeHeader(const FrameHeader &header);

/**
 * @brief Parses and validates a 16-byte header.
 *
 * Fails with kProtocolViolation on a bad magic and kMessageTooLarge when
 * the announced payload exceeds the message limit.  A version mismatch is
 * not an error here: the dispatcher answers it explicitly.
 */
[[nodiscard]] core::Expected<FrameHeader> decodeHeader(std::span<const core::byte> bytes);

/**
 * @brief Header followed by payload, ready to write to a socket.
 */
[[nodiscard]] core::Expected<core::Bytes> encodeFrame(const Frame &frame);

/**
 * @brief Parses a complete frame held in one buffer.
 */
[[nodiscard]] core::Expected<Frame> decodeFrame(std::span<const core::byte> bytes);

} // namespace hop::net::protocol

#endif // HOP_NET_PROTOCOL_PROTOCOL_HPP
