/**
 * @file PeerClient.cpp
 * @brief PeerClient implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/net/PeerClient.hpp>

#include <format>

namespace hop::net {

PeerClient::PeerClient(const cluster::NodeTable &nodes, std::shared_ptr<transport::ITransport> transport)
    : _nodes(nodes), _transport(std::move(transport))
{
}

core::Expected<transport::Endpoint> PeerClient::endpointOf(const core::NodeId &node) const
{
    const auto config = HOP_TRY(_nodes.resolve(node));
    return transport::Endpoint{config.address, config.port};
}

core::Expected<protocol::Frame> PeerClient::call(const core::NodeId &destination,
                                                 const protocol::Frame &request,
                                                 std::chrono::milliseconds timeout) const
{
    const auto endpoint = HOP_TRY(endpointOf(destination));
    auto reply = HOP_TRY(_transport->request(endpoint, request, timeout));

    if (reply.type() == protocol::MessageType::Error)
    {
        const auto remote = HOP_TRY(protocol::ErrorMessage::decode(reply));
        return std::unexpected(remote.toError());
    }
    return reply;
}

core::Expected<protocol::MigrationResponse> PeerClient::migrate(const core::NodeId &destination,
                                                                const protocol::Frame &request,
                                                                std::chrono::milliseconds timeout) const
{
    const auto reply = HOP_TRY(call(destination, request, timeout));
    return protocol::MigrationResponse::decode(reply);
}

core::Expected<protocol::BaselineReply> PeerClient::queryBaseline(const core::NodeId &destination,
                                                                  const protocol::BaselineQuery &query,
                                                                  std::chrono::milliseconds timeout) const
{
    const auto reply = HOP_TRY(call(destination, query.encode(), timeout));
    return protocol::BaselineReply::decode(reply);
}

core::Expected<protocol::HeartbeatAck> PeerClient::heartbeat(const core::NodeId &destination,
                                                             const protocol::HeartbeatMessage &heartbeat,
                                                             std::chrono::milliseconds timeout) const
{
    const auto reply = HOP_TRY(call(destination, heartbeat.encode(), timeout));
    return protocol::HeartbeatAck::decode(reply);
}

core::ExpectedVoid PeerClient::shutdown(const core::NodeId &destination,
                                        const protocol::ShutdownMessage &message,
                                        std::chrono::milliseconds timeout) const
{
    const auto reply = HOP_TRY(call(destination, message.encode(), timeout));
    if (reply.type() != protocol::MessageType::ShutdownAck)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::format("expected ShutdownAck, got {}", protocol::toString(reply.type())));
    }
    return {};
}

} // namespace hop::net
