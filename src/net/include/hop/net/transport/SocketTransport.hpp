// /////////////////////////////////////////////////////////////////////////////
/// @file SocketTransport.hpp
/// @brief POSIX TCP client and listener.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hop/net/transport/ITransport.hpp>
#include <hop/core/NonCopyable.hpp>

#include <memory>

namespace hop::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class SocketTransport
/// @brief POSIX TCP client: one short-lived connection per request.
///
/// Connects with a non-blocking @c connect bounded by the request timeout,
/// writes the frame, then reads exactly one response frame.
// /////////////////////////////////////////////////////////////////////////////
class SocketTransport final : public ITransport,
                              public core::NonCopyable<SocketTransport>
{
public:
    SocketTransport();
    ~SocketTransport() override;

    [[nodiscard]] core::Expected<protocol::Frame> request(
        const Endpoint& endpoint,
        const protocol::Frame& frame,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] const char* name() const noexcept override;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class SocketListener
/// @brief POSIX TCP server.
///
/// Binds to a local port on @ref open; an accept thread hands each
/// connection to a worker pool which reads one frame, invokes the handler
/// and writes the response.  Port 0 binds an ephemeral port, reported by
/// @ref endpoint.
// /////////////////////////////////////////////////////////////////////////////
class SocketListener final : public IListener,
                             public core::NonMovable<SocketListener>
{
public:
    /// @param bindAddress IPv4 address to bind ("0.0.0.0" for all).
    /// @param port        Local TCP port (0 = ephemeral).
    /// @param workers     Worker threads serving requests.
    SocketListener(std::string bindAddress, core::u16 port, core::u32 workers);
    ~SocketListener() override;

    [[nodiscard]] core::Expected<void> open(FrameHandler handler) override;
    void close() override;

    [[nodiscard]] Endpoint endpoint() const override;
    [[nodiscard]] const char* name() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hop::net::transport
