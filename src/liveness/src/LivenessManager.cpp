// /////////////////////////////////////////////////////////////////////////////
/// @file LivenessManager.cpp
/// @brief LivenessManager implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/liveness/LivenessManager.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

namespace hop::liveness {

namespace {

core::u64 wallClockMs()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<core::u64>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // anonymous namespace

struct LivenessManager::Impl
{
    core::NodeId                  self;
    const cluster::ClusterConfig& config;
    const net::PeerClient&        peers;
    const bool                    entry;

    std::atomic<bool>      executionStarted{false};
    std::atomic<core::u64> sequence{0};
    std::atomic<core::u64> received{0};
    core::u64              probedReceived{0};

    std::mutex      handlerMutex;
    ShutdownHandler shutdownHandler;
    PeerLostHandler peerLostHandler;

    std::mutex                                     monitorMutex;
    std::vector<std::unique_ptr<HeartbeatMonitor>> peerMonitors;
    std::unique_ptr<HeartbeatMonitor>              coordinatorMonitor;
    bool                                           started{false};

    Impl(core::NodeId id, const cluster::ClusterConfig& cfg, const net::PeerClient& p)
        : self{std::move(id)}
        , config{cfg}
        , peers{p}
        , entry{cfg.nodes().isEntry(self)}
    {}

    const cluster::HeartbeatSettings& settings() const { return config.heartbeat(); }

    net::protocol::HeartbeatMessage nextHeartbeat()
    {
        return net::protocol::HeartbeatMessage{self, wallClockMs(), ++sequence,
                                               executionStarted.load(std::memory_order_acquire)};
    }

    void requestShutdown(const std::string& reason)
    {
        ShutdownHandler handler;
        {
            std::lock_guard lock{handlerMutex};
            handler = shutdownHandler;
        }
        if (handler)
            handler(reason);
    }

    void broadcastShutdown(const std::string& reason)
    {
        const net::protocol::ShutdownMessage message{self, reason};
        for (const auto& peer : config.nodes().peersOf(self))
        {
            auto sent = peers.shutdown(peer.id, message, std::chrono::milliseconds{core::kControlTimeoutMs});
            if (!sent)
            {
                core::Log::warn("liveness", std::format("shutdown notice to {} failed: {}", peer.id,
                                                        sent.error().describe()));
            }
        }
    }

    void peerLost(const core::NodeId& peer)
    {
        PeerLostHandler handler;
        {
            std::lock_guard lock{handlerMutex};
            handler = peerLostHandler;
        }
        if (handler)
            handler(peer);

        if (!settings().peerMonitoring)
        {
            core::Log::warn("liveness", std::format("peer {} lost; peer monitoring disabled, continuing", peer));
            return;
        }

        const core::Error lost{core::ErrorCode::kLivenessLost,
                               std::format("peer {} missed {} heartbeats", peer, settings().missThreshold)};
        const auto reason = lost.describe();
        core::Log::error("liveness", std::format("{}, shutting the cluster down", reason));
        broadcastShutdown(reason);
        requestShutdown(reason);
    }

    void coordinatorLost(const core::NodeId& coordinator)
    {
        if (settings().followerOnCoordinatorLost == cluster::CoordinatorLossPolicy::Ignore)
        {
            core::Log::warn("liveness", std::format("coordinator {} lost, policy ignore: continuing", coordinator));
            return;
        }
        const core::Error lost{core::ErrorCode::kLivenessLost,
                               std::format("coordinator {} silent for {} heartbeats", coordinator,
                                           settings().missThreshold)};
        core::Log::error("liveness", std::format("{}, shutting down", lost.describe()));
        requestShutdown(lost.describe());
    }

    std::unique_ptr<HeartbeatMonitor> makePeerMonitor(const core::NodeId& peer)
    {
        const auto interval = settings().interval;
        return std::make_unique<HeartbeatMonitor>(
            peer, interval, settings().missThreshold,
            [this, peer, interval] { return peers.heartbeat(peer, nextHeartbeat(), interval).has_value(); },
            [this](const core::NodeId& lost) { peerLost(lost); }, true, settings().minLostDuration);
    }

    std::unique_ptr<HeartbeatMonitor> makeCoordinatorMonitor()
    {
        return std::make_unique<HeartbeatMonitor>(
            config.nodes().entry().id, settings().interval, settings().missThreshold,
            [this] {
                const auto now = received.load(std::memory_order_acquire);
                const bool fresh = now != probedReceived;
                probedReceived = now;
                return fresh;
            },
            [this](const core::NodeId& lost) { coordinatorLost(lost); },
            false, settings().minLostDuration);
    }
};

LivenessManager::LivenessManager(core::NodeId self,
                                 const cluster::ClusterConfig& config,
                                 const net::PeerClient& peers)
    : impl_{std::make_unique<Impl>(std::move(self), config, peers)}
{
    if (!impl_->entry && config.heartbeat().coordinatorMonitoring)
        impl_->coordinatorMonitor = impl_->makeCoordinatorMonitor();
}

LivenessManager::~LivenessManager()
{
    stop();
}

void LivenessManager::registerHandlers(net::Dispatcher& dispatcher)
{
    dispatcher.on(net::protocol::MessageType::Heartbeat,
                  [this](const net::protocol::Frame& frame) -> core::Expected<net::protocol::Frame> {
                      const auto hb = HOP_TRY(net::protocol::HeartbeatMessage::decode(frame));
                      if (hb.sender == impl_->config.nodes().entry().id)
                      {
                          impl_->received.fetch_add(1, std::memory_order_acq_rel);
                          if (hb.executionStarted && impl_->coordinatorMonitor
                              && !impl_->coordinatorMonitor->armed())
                          {
                              core::Log::debug("liveness", "execution started, watching the coordinator");
                              impl_->coordinatorMonitor->arm();
                          }
                      }
                      return net::protocol::HeartbeatAck{impl_->self, wallClockMs(), hb.sequence}.encode();
                  });

    dispatcher.on(net::protocol::MessageType::Shutdown,
                  [this](const net::protocol::Frame& frame) -> core::Expected<net::protocol::Frame> {
                      const auto msg = HOP_TRY(net::protocol::ShutdownMessage::decode(frame));
                      core::Log::warn("liveness", std::format("shutdown requested by {}: {}", msg.sender, msg.reason));
                      impl_->requestShutdown(msg.reason);
                      return net::protocol::makeFrame(net::protocol::MessageType::ShutdownAck, {}, 0,
                                                      static_cast<core::u8>(net::protocol::FrameFlag::Response));
                  });
}

void LivenessManager::onShutdownRequested(ShutdownHandler handler)
{
    std::lock_guard lock{impl_->handlerMutex};
    impl_->shutdownHandler = std::move(handler);
}

void LivenessManager::onPeerLost(PeerLostHandler handler)
{
    std::lock_guard lock{impl_->handlerMutex};
    impl_->peerLostHandler = std::move(handler);
}

core::Expected<void> LivenessManager::awaitPeersReady()
{
    if (!impl_->entry)
        return {};

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + impl_->settings().readinessTimeout;

    for (const auto& peer : impl_->config.nodes().peersOf(impl_->self))
    {
        auto backoff = std::chrono::milliseconds{core::kReadinessInitialBackoffMs};
        for (;;)
        {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            const auto timeout = std::clamp(remaining, std::chrono::milliseconds{1},
                                            std::chrono::milliseconds{core::kControlTimeoutMs});

            auto ping = impl_->peers.heartbeat(peer.id, impl_->nextHeartbeat(), timeout);
            if (ping)
            {
                core::Log::info("liveness", std::format("peer {} ready", peer.id));
                break;
            }

            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (left.count() <= 0)
            {
                return core::makeError(core::ErrorCode::kTimeout,
                                       std::format("peer {} not ready after {}ms: {}", peer.id,
                                                   impl_->settings().readinessTimeout.count(),
                                                   ping.error().describe()));
            }

            core::Log::debug("liveness", std::format("waiting for {}: {}", peer.id, ping.error().describe()));
            std::this_thread::sleep_for(std::min(backoff, left));
            backoff = std::min(backoff * 2, std::chrono::milliseconds{core::kReadinessMaxBackoffMs});
        }
    }
    return {};
}

void LivenessManager::start()
{
    std::lock_guard lock{impl_->monitorMutex};
    if (impl_->started)
        return;
    impl_->started = true;

    if (impl_->entry)
    {
        for (const auto& peer : impl_->config.nodes().peersOf(impl_->self))
        {
            impl_->peerMonitors.push_back(impl_->makePeerMonitor(peer.id));
            impl_->peerMonitors.back()->start();
        }
    }
    else if (impl_->coordinatorMonitor)
    {
        impl_->coordinatorMonitor->start();
    }

    core::Log::info("liveness", std::format("{} liveness started as {}", impl_->self,
                                            impl_->entry ? "entry node" : "follower"));
}

void LivenessManager::stop()
{
    std::lock_guard lock{impl_->monitorMutex};
    for (auto& monitor : impl_->peerMonitors)
        monitor->stop();
    if (impl_->coordinatorMonitor)
        impl_->coordinatorMonitor->stop();
}

void LivenessManager::markExecutionStarted() noexcept
{
    impl_->executionStarted.store(true, std::memory_order_release);
}

void LivenessManager::broadcastShutdown(const std::string& reason)
{
    impl_->broadcastShutdown(reason);
}

bool LivenessManager::isEntry() const noexcept
{
    return impl_->entry;
}

std::optional<LivenessState> LivenessManager::peerState(const core::NodeId& peer) const
{
    std::lock_guard lock{impl_->monitorMutex};
    const auto it = std::ranges::find_if(impl_->peerMonitors,
                                         [&peer](const auto& m) { return m->record().target() == peer; });
    if (it == impl_->peerMonitors.end())
        return std::nullopt;
    return (*it)->state();
}

std::optional<LivenessState> LivenessManager::coordinatorState() const
{
    if (!impl_->coordinatorMonitor)
        return std::nullopt;
    return impl_->coordinatorMonitor->state();
}

core::u64 LivenessManager::heartbeatsReceived() const noexcept
{
    return impl_->received.load(std::memory_order_acquire);
}

} // namespace hop::liveness
