// /////////////////////////////////////////////////////////////////////////////
/// @file LivenessManager.hpp
/// @brief Cluster liveness: heartbeat push, peer and coordinator monitors.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hop/liveness/HeartbeatMonitor.hpp>
#include <hop/cluster/ClusterConfig.hpp>
#include <hop/net/Dispatcher.hpp>
#include <hop/net/PeerClient.hpp>
#include <hop/core/Expected.hpp>

#include <memory>
#include <optional>
#include <string>

namespace hop::liveness {

// /////////////////////////////////////////////////////////////////////////////
/// @class LivenessManager
/// @brief Heartbeat exchange between the entry node and its followers.
///
/// Entry node:
///   - pushes a heartbeat to every peer each interval; a failed round trip
///     counts as a miss for that peer;
///   - when a peer is Lost and peer monitoring is on, broadcasts a cluster
///     shutdown and requests its own shutdown;
///   - @ref awaitPeersReady blocks until every peer answers a ping.
///
/// Follower:
///   - counts ticks without a new heartbeat from the entry node, starting
///     once a heartbeat announced that execution started;
///   - on Lost applies the coordinator-loss policy (shutdown_self or ignore).
///
/// Runs independently of the migration traffic.
// /////////////////////////////////////////////////////////////////////////////
class LivenessManager final : public core::NonMovable<LivenessManager>
{
public:
    using ShutdownHandler = std::function<void(const std::string& reason)>;
    using PeerLostHandler = std::function<void(const core::NodeId& peer)>;

    LivenessManager(core::NodeId self,
                    const cluster::ClusterConfig& config,
                    const net::PeerClient& peers);
    ~LivenessManager();

    /// @brief Installs the Heartbeat and Shutdown handlers.
    void registerHandlers(net::Dispatcher& dispatcher);

    /// @brief Local shutdown hook (must not block).
    void onShutdownRequested(ShutdownHandler handler);

    /// @brief Called once per peer declared Lost.
    void onPeerLost(PeerLostHandler handler);

    /// @brief Entry node: bounded wait until every peer answers a ping.
    [[nodiscard]] core::Expected<void> awaitPeersReady();

    /// @brief Starts the monitors matching this node's role.
    void start();

    /// @brief Stops and joins every monitor (idempotent).
    void stop();

    /// @brief Entry node: heartbeats now announce that execution started.
    void markExecutionStarted() noexcept;

    /// @brief Best-effort shutdown request to every peer.
    void broadcastShutdown(const std::string& reason);

    [[nodiscard]] bool isEntry() const noexcept;

    /// @brief State of a monitored peer (entry node only).
    [[nodiscard]] std::optional<LivenessState> peerState(const core::NodeId& peer) const;

    /// @brief State of the entry node as seen by a follower.
    [[nodiscard]] std::optional<LivenessState> coordinatorState() const;

    /// @brief Heartbeats received from the entry node.
    [[nodiscard]] core::u64 heartbeatsReceived() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hop::liveness
