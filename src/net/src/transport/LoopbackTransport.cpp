// /////////////////////////////////////////////////////////////////////////////
/// @file LoopbackTransport.cpp
/// @brief In-process transport implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/net/transport/LoopbackTransport.hpp>
#include <hop/core/Log.hpp>

#include <format>
#include <thread>

namespace hop::net::transport {

// ----- //  LoopbackNetwork  // ----- //

core::Expected<void> LoopbackNetwork::bind(const Endpoint& endpoint, FrameHandler handler)
{
    std::lock_guard lock{mutex_};
    const auto key = endpoint.toString();
    if (handlers_.contains(key))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               std::format("loopback endpoint {} already bound", key));
    }
    handlers_.emplace(key, std::make_shared<FrameHandler>(std::move(handler)));
    return {};
}

void LoopbackNetwork::unbind(const Endpoint& endpoint)
{
    std::lock_guard lock{mutex_};
    handlers_.erase(endpoint.toString());
}

void LoopbackNetwork::setReachable(const Endpoint& endpoint, bool reachable)
{
    std::lock_guard lock{mutex_};
    if (reachable)
        unreachable_.erase(endpoint.toString());
    else
        unreachable_.insert(endpoint.toString());
}

void LoopbackNetwork::setBlackhole(const Endpoint& endpoint, bool blackhole)
{
    std::lock_guard lock{mutex_};
    if (blackhole)
        blackholes_.insert(endpoint.toString());
    else
        blackholes_.erase(endpoint.toString());
}

core::Expected<protocol::Frame> LoopbackNetwork::deliver(
    const Endpoint& endpoint,
    const protocol::Frame& frame,
    std::chrono::milliseconds timeout)
{
    const auto key = endpoint.toString();
    std::shared_ptr<FrameHandler> handler;
    bool blackhole = false;
    {
        std::lock_guard lock{mutex_};
        ++requests_[key];

        if (unreachable_.contains(key))
        {
            return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                                   std::format("loopback: {} unreachable", key));
        }
        blackhole = blackholes_.contains(key);

        if (auto it = handlers_.find(key); it != handlers_.end())
            handler = it->second;
    }

    if (blackhole)
    {
        std::this_thread::sleep_for(timeout);
        return core::makeError(core::ErrorCode::kTimeout,
                               std::format("loopback: no answer from {} within {}ms", key, timeout.count()));
    }
    if (!handler)
    {
        return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                               std::format("loopback: nothing listening on {}", key));
    }

    // Round-trip both directions through the byte codec.
    const auto wireRequest = HOP_TRY(protocol::encodeFrame(frame));
    const auto inbound     = HOP_TRY(protocol::decodeFrame(wireRequest));
    const auto response    = (*handler)(inbound);
    const auto wireReply   = HOP_TRY(protocol::encodeFrame(response));
    return protocol::decodeFrame(wireReply);
}

core::u64 LoopbackNetwork::requestCount(const Endpoint& endpoint) const
{
    std::lock_guard lock{mutex_};
    const auto it = requests_.find(endpoint.toString());
    return it != requests_.end() ? it->second : 0;
}

// ----- //  LoopbackTransport  // ----- //

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackNetwork> network)
    : network_{std::move(network)}
{}

core::Expected<protocol::Frame> LoopbackTransport::request(
    const Endpoint& endpoint,
    const protocol::Frame& frame,
    std::chrono::milliseconds timeout)
{
    return network_->deliver(endpoint, frame, timeout);
}

const char* LoopbackTransport::name() const noexcept
{
    return "LoopbackTransport";
}

// ----- //  LoopbackListener  // ----- //

LoopbackListener::LoopbackListener(std::shared_ptr<LoopbackNetwork> network, Endpoint endpoint)
    : network_{std::move(network)}, endpoint_{std::move(endpoint)}
{}

LoopbackListener::~LoopbackListener()
{
    close();
}

core::Expected<void> LoopbackListener::open(FrameHandler handler)
{
    if (open_)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "loopback listener already open");
    }
    HOP_TRY_VOID(network_->bind(endpoint_, std::move(handler)));
    open_ = true;
    core::Log::debug("net", std::format("LoopbackListener: bound {}", endpoint_.toString()));
    return {};
}

void LoopbackListener::close()
{
    if (!open_)
        return;
    network_->unbind(endpoint_);
    open_ = false;
}

const char* LoopbackListener::name() const noexcept
{
    return "LoopbackListener";
}

} // namespace hop::net::transport
