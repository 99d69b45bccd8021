/**
 * @file NodeTable.cpp
 * @brief NodeTable validation and lookup.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "hop/cluster/NodeTable.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace hop::cluster {

core::Expected<NodeTable> NodeTable::create(std::vector<NodeConfig> nodes)
{
    if (nodes.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "node table must contain at least one node");
    }

    std::unordered_set<std::string> seen;
    for (const auto &node : nodes)
    {
        if (node.id.empty())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, "node id must not be empty");
        }
        if (node.address.empty())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("node '{}' has an empty address", node.id));
        }
        if (node.port == 0)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("node '{}' has port 0", node.id));
        }
        if (!seen.insert(node.id).second)
        {
            return core::makeError(core::ErrorCode::kAlreadyExists,
                                   std::format("duplicate node id '{}'", node.id));
        }
    }

    return NodeTable{std::move(nodes)};
}

const NodeConfig *NodeTable::find(const core::NodeId &id) const noexcept
{
    auto it = std::ranges::find(_nodes, id, &NodeConfig::id);
    return (it != _nodes.end()) ? &*it : nullptr;
}

core::Expected<NodeConfig> NodeTable::resolve(const core::NodeId &id) const
{
    if (const auto *node = find(id))
    {
        return *node;
    }
    return core::makeError(core::ErrorCode::kNotFound,
                           std::format("node '{}' is not in the node table", id));
}

std::vector<NodeConfig> NodeTable::peersOf(const core::NodeId &self) const
{
    std::vector<NodeConfig> peers;
    peers.reserve(_nodes.size());
    for (const auto &node : _nodes)
    {
        if (node.id != self)
        {
            peers.push_back(node);
        }
    }
    return peers;
}

} // namespace hop::cluster
