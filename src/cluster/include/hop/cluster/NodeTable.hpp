/**
 * @file NodeTable.hpp
 * @brief Static, ordered mapping from node identifier to network address.
 *
 * Loaded once from the cluster configuration and read-only for the lifetime
 * of the process.  The first declared node is the entry node: it starts
 * program execution and acts as the coordinator for liveness purposes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_CLUSTER_NODE_TABLE_HPP
    #define HOP_CLUSTER_NODE_TABLE_HPP

    #include <hop/core/Types.hpp>
    #include <hop/core/Expected.hpp>

    #include <optional>
    #include <string>
    #include <vector>

namespace hop::cluster {

/**
 * @brief One entry of the node table.
 */
struct NodeConfig
{
    core::NodeId               id;
    std::string                address;
    core::u16                  port{0};
    /// Orchestrator placement group; carried but not interpreted here.
    std::optional<std::string> placement;

    [[nodiscard]] bool operator==(const NodeConfig &) const = default;
};

/**
 * @brief Ordered, immutable node table.
 */
class NodeTable final
{
public:
    NodeTable() = default;

    /**
     * @brief Validates and builds a table.
     *
     * Fails with InvalidArgument when the list is empty, an id or address
     * is empty, a port is zero, or an id appears twice.
     */
    [[nodiscard]] static core::Expected<NodeTable> create(std::vector<NodeConfig> nodes);

    /// @brief Looks up a node by id.
    [[nodiscard]] const NodeConfig *find(const core::NodeId &id) const noexcept;

    /// @brief Looks up a node by id, failing with NotFound.
    [[nodiscard]] core::Expected<NodeConfig> resolve(const core::NodeId &id) const;

    [[nodiscard]] bool contains(const core::NodeId &id) const noexcept { return find(id) != nullptr; }

    /// @brief The first declared node.
    [[nodiscard]] const NodeConfig &entry() const noexcept { return _nodes.front(); }

    [[nodiscard]] bool isEntry(const core::NodeId &id) const noexcept
    {
        return !_nodes.empty() && _nodes.front().id == id;
    }

    /// @brief Every node except @p self, in declaration order.
    [[nodiscard]] std::vector<NodeConfig> peersOf(const core::NodeId &self) const;

    [[nodiscard]] const std::vector<NodeConfig> &nodes() const noexcept { return _nodes; }
    [[nodiscard]] core::usize size() const noexcept { return _nodes.size(); }
    [[nodiscard]] bool empty() const noexcept { return _nodes.empty(); }

private:
    explicit NodeTable(std::vector<NodeConfig> nodes) : _nodes(std::move(nodes)) {}

    std::vector<NodeConfig> _nodes;
};

} // namespace hop::cluster

#endif // HOP_CLUSTER_NODE_TABLE_HPP
