/**
 * @file Messages.hpp
 * @brief Typed payloads carried inside frames.
 *
 * Every message has an @c encode that produces a complete Frame and a
 * @c decode that validates a Frame of the matching type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_NET_PROTOCOL_MESSAGES_HPP
    #define HOP_NET_PROTOCOL_MESSAGES_HPP

#include <hop/net/protocol/Protocol.hpp>
#include <hop/serial/ExecutionSnapshot.hpp>
#include <hop/core/Expected.hpp>
#include <hop/core/Types.hpp>

#include <string>
#include <string_view>

namespace hop::net::protocol {

// ----- //  Migration  // ----- //

/**
 * @brief One migration of an execution from @c source to @c destination.
 *
 * @c migrationId stays the same across transport retries so the
 * destination can recognise a request it already applied.
 */
struct MigrationRequest
{
    core::MigrationId           migrationId{0};
    core::NodeId                source;
    core::NodeId                destination;
    /// Digest of the executing module; both sides must run the same one.
    core::u64                   moduleDigest{0};
    /// Baseline id both sides record for this pair once the migration
    /// completes.
    core::u64                   nextBaselineId{0};
    serial::ExecutionSnapshot   snapshot;

    [[nodiscard]] core::Expected<Frame> encode() const;
    [[nodiscard]] static core::Expected<MigrationRequest> decode(const Frame &frame);

    /// @brief Reads only the leading migration id (for rejecting frames of
    ///        an unknown scheme version).
    [[nodiscard]] static core::Expected<core::MigrationId> peekId(const Frame &frame);
};

enum class MigrationStatus : core::u8
{
    Acknowledged = 0,
    Rejected     = 1
};

enum class RejectReason : core::u8
{
    None                  = 0,
    UnsupportedVersion    = 1,
    MalformedPayload      = 2,
    NotHostedHere         = 3,
    ModuleMismatch        = 4,
    InsufficientResources = 5,
    BaselineMismatch      = 6,
    RestoreFailed         = 7
};

[[nodiscard]] std::string_view toString(RejectReason reason) noexcept;

struct MigrationResponse
{
    core::MigrationId migrationId{0};
    MigrationStatus   status{MigrationStatus::Acknowledged};
    RejectReason      reason{RejectReason::None};
    std::string       detail;

    [[nodiscard]] static MigrationResponse acknowledged(core::MigrationId id);
    [[nodiscard]] static MigrationResponse rejected(core::MigrationId id, RejectReason reason,
                                                    std::string detail);

    [[nodiscard]] bool isAcknowledged() const noexcept { return status == MigrationStatus::Acknowledged; }

    [[nodiscard]] Frame encode() const;
    [[nodiscard]] static core::Expected<MigrationResponse> decode(const Frame &frame);

    [[nodiscard]] bool operator==(const MigrationResponse &) const = default;
};

// ----- //  Baseline negotiation  // ----- //

/// @brief Asks the destination which baseline it holds for @c requester.
struct BaselineQuery
{
    core::NodeId requester;

    [[nodiscard]] Frame encode() const;
    [[nodiscard]] static core::Expected<BaselineQuery> decode(const Frame &frame);
};

struct BaselineReply
{
    bool      hasBaseline{false};
    core::u64 baselineId{0};

    [[nodiscard]] Frame encode() const;
    [[nodiscard]] static core::Expected<BaselineReply> decode(const Frame &frame);
};

// ----- //  Liveness  // ----- //

/**
 * @brief Heartbeat pushed by the entry node to every peer.
 *
 * A successful round trip proves the peer reachable; receipt proves the
 * entry node alive to the follower.
 */
struct HeartbeatMessage
{
    core::NodeId sender;
    /// Sender wall clock, milliseconds since the Unix epoch.
    core::u64    timestampMs{0};
    core::u64    sequence{0};
    bool         executionStarted{false};

    [[nodiscard]] Frame encode() const;
    [[nodiscard]] static core::Expected<HeartbeatMessage> decode(const Frame &frame);
};

struct HeartbeatAck
{
    core::NodeId sender;
    core::u64    timestampMs{0};
    core::u64    sequence{0};

    [[nodiscard]] Frame encode() const;
    [[nodiscard]] static core::Expected<HeartbeatAck> decode(const Frame &frame);
};

/// @brief Cluster-wide stop request.
struct ShutdownMessage
{
    core::NodeId sender;
    std::string  reason;

    [[nodiscard]] Frame encode() const;
    [[nodiscard]] static core::Expected<ShutdownMessage> decode(const Frame &frame);
};

// ----- //  Errors  // ----- //

/// @brief Generic failure answer for any request.
struct ErrorMessage
{
    core::ErrorCode code{core::ErrorCode::kInternalError};
    std::string     message;

    [[nodiscard]] Frame encode() const;
    [[nodiscard]] static core::Expected<ErrorMessage> decode(const Frame &frame);

    /// @brief Converts an Error frame into the matching core::Error.
    [[nodiscard]] core::Error toError() const;
};

} // namespace hop::net::protocol

#endif // HOP_NET_PROTOCOL_MESSAGES_HPP
