// /////////////////////////////////////////////////////////////////////////////
/// @file LoopbackTransport.hpp
/// @brief In-process transport with fault injection, for tests and demos.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hop/net/transport/ITransport.hpp>
#include <hop/core/NonCopyable.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace hop::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class LoopbackNetwork
/// @brief Shared registry mapping endpoints to in-process handlers.
///
/// Frames are still encoded to bytes and decoded on the other side so the
/// wire codec is exercised exactly as over TCP.
///
/// Fault injection:
///   - @ref setReachable(ep, false) : requests fail with kNetworkConnectFailed.
///   - @ref setBlackhole(ep, true)  : requests hang for their timeout, then
///                                    fail with kTimeout.
// /////////////////////////////////////////////////////////////////////////////
class LoopbackNetwork final : public core::NonMovable<LoopbackNetwork>
{
public:
    LoopbackNetwork() = default;

    [[nodiscard]] core::Expected<void> bind(const Endpoint& endpoint, FrameHandler handler);
    void unbind(const Endpoint& endpoint);

    void setReachable(const Endpoint& endpoint, bool reachable);
    void setBlackhole(const Endpoint& endpoint, bool blackhole);

    /// @brief Delivers @p frame to the handler bound at @p endpoint.
    [[nodiscard]] core::Expected<protocol::Frame> deliver(
        const Endpoint& endpoint,
        const protocol::Frame& frame,
        std::chrono::milliseconds timeout);

    /// @brief Number of requests addressed to @p endpoint, failed ones included.
    [[nodiscard]] core::u64 requestCount(const Endpoint& endpoint) const;

private:
    mutable std::mutex                               mutex_;
    std::map<std::string, std::shared_ptr<FrameHandler>> handlers_;
    std::set<std::string>                            unreachable_;
    std::set<std::string>                            blackholes_;
    std::map<std::string, core::u64>                 requests_;
};

/// @brief Client side bound to a @ref LoopbackNetwork.
class LoopbackTransport final : public ITransport
{
public:
    explicit LoopbackTransport(std::shared_ptr<LoopbackNetwork> network);

    [[nodiscard]] core::Expected<protocol::Frame> request(
        const Endpoint& endpoint,
        const protocol::Frame& frame,
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] const char* name() const noexcept override;

private:
    std::shared_ptr<LoopbackNetwork> network_;
};

/// @brief Server side bound to a @ref LoopbackNetwork.
class LoopbackListener final : public IListener,
                               public core::NonCopyable<LoopbackListener>
{
public:
    LoopbackListener(std::shared_ptr<LoopbackNetwork> network, Endpoint endpoint);
    ~LoopbackListener() override;

    [[nodiscard]] core::Expected<void> open(FrameHandler handler) override;
    void close() override;

    [[nodiscard]] Endpoint endpoint() const override { return endpoint_; }
    [[nodiscard]] const char* name() const noexcept override;

private:
    std::shared_ptr<LoopbackNetwork> network_;
    Endpoint                         endpoint_;
    bool                             open_{false};
};

} // namespace hop::net::transport
