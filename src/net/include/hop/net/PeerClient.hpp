/**
 * @file PeerClient.hpp
 * @brief Typed request/response calls to other nodes, addressed by id.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_NET_PEER_CLIENT_HPP
    #define HOP_NET_PEER_CLIENT_HPP

#include <hop/cluster/NodeTable.hpp>
#include <hop/net/protocol/Messages.hpp>
#include <hop/net/transport/ITransport.hpp>

#include <chrono>
#include <memory>

namespace hop::net {

/**
 * @brief Resolves node ids through the node table and performs one
 *        request per call over an ITransport.
 *
 * An Error frame from the remote side is turned back into its
 * core::Error.  No call retries; see MigrationTransport for that.
 */
class PeerClient final {
public:
    PeerClient(const cluster::NodeTable &nodes, std::shared_ptr<transport::ITransport> transport);

    [[nodiscard]] core::Expected<transport::Endpoint> endpointOf(const core::NodeId &node) const;

    /// @brief Sends an already encoded MigrateRequest frame.
    [[nodiscard]] core::Expected<protocol::MigrationResponse> migrate(
        const core::NodeId &destination, const protocol::Frame &request,
        std::chrono::milliseconds timeout) const;

    [[nodiscard]] core::Expected<protocol::BaselineReply> queryBaseline(
        const core::NodeId &destination, const protocol::BaselineQuery &query,
        std::chrono::milliseconds timeout) const;

    [[nodiscard]] core::Expected<protocol::HeartbeatAck> heartbeat(
        const core::NodeId &destination, const protocol::HeartbeatMessage &heartbeat,
        std::chrono::milliseconds timeout) const;

    [[nodiscard]] core::ExpectedVoid shutdown(
        const core::NodeId &destination, const protocol::ShutdownMessage &message,
        std::chrono::milliseconds timeout) const;

    [[nodiscard]] const cluster::NodeTable &nodes() const noexcept { return _nodes; }

private:
    [[nodiscard]] core::Expected<protocol::Frame> call(
        const core::NodeId &destination, const protocol::Frame &request,
        std::chrono::milliseconds timeout) const;

    const cluster::NodeTable              &_nodes;
    std::shared_ptr<transport::ITransport> _transport;
};

} // namespace hop::net

#endif // HOP_NET_PEER_CLIENT_HPP
