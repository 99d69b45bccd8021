// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract request/response transport (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hop/net/protocol/Protocol.hpp>
#include <hop/core/Types.hpp>
#include <hop/core/Expected.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace hop::net::transport {

/// @brief Network address of a node.
struct Endpoint
{
    std::string host;
    core::u16   port{0};

    [[nodiscard]] std::string toString() const { return host + ":" + std::to_string(port); }

    [[nodiscard]] bool operator==(const Endpoint&) const = default;
};

/// @brief Server-side callback: one request frame in, one response out.
using FrameHandler = std::function<protocol::Frame(const protocol::Frame&)>;

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Client side of the transport layer.
///
/// Concrete implementations:
///   - @c SocketTransport    : one TCP connection per request.
///   - @c LoopbackTransport  : in-process delivery to a @c LoopbackNetwork.
///
/// Failures are reported with network-level error codes
/// (@c kNetworkConnectFailed, @c kNetworkSendFailed, @c kTimeout, ...) so
/// callers can decide whether to retry.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @brief Sends @p frame to @p endpoint and waits for its response.
    /// @param endpoint Destination node address.
    /// @param frame    Request frame.
    /// @param timeout  Upper bound for connect + send + response.
    /// @return The response frame, or error.
    [[nodiscard]] virtual core::Expected<protocol::Frame> request(
        const Endpoint& endpoint,
        const protocol::Frame& frame,
        std::chrono::milliseconds timeout) = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IListener
/// @brief Server side of the transport layer.
///
/// Requests may be served concurrently; @p handler must be thread-safe.
// /////////////////////////////////////////////////////////////////////////////
class IListener
{
public:
    virtual ~IListener() = default;

    /// @brief Starts accepting requests (bind, listen, spawn workers).
    [[nodiscard]] virtual core::Expected<void> open(FrameHandler handler) = 0;

    /// @brief Stops accepting and waits for in-flight requests.
    virtual void close() = 0;

    /// @brief Address peers use to reach this listener.
    [[nodiscard]] virtual Endpoint endpoint() const = 0;

    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace hop::net::transport
