// /////////////////////////////////////////////////////////////////////////////
/// @file ClusterConfig.hpp
/// @brief Cluster configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises the node table, heartbeat and migration tunables.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <hop/cluster/NodeTable.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Expected.hpp>
#include <hop/core/Types.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace hop::cluster {

/// @brief What a follower does once the entry node is considered lost.
enum class CoordinatorLossPolicy : core::u8
{
    ShutdownSelf,
    Ignore
};

/// @brief How linear memory is shipped to a peer.
enum class MemoryStrategy : core::u8
{
    Delta,
    Full
};

/// @brief What the source does after a successful migration.
enum class ReturnSemantics : core::u8
{
    /// Stay idle; the called function migrates back when it returns.
    CallReturn,
    /// Terminate local execution.
    Move
};

[[nodiscard]] std::string_view toString(CoordinatorLossPolicy policy) noexcept;
[[nodiscard]] std::string_view toString(MemoryStrategy strategy) noexcept;

/// @brief Bounded exponential backoff settings for migration sends.
struct RetrySettings
{
    core::u32                 maxAttempts{core::kMigrationMaxAttempts};
    std::chrono::milliseconds initialBackoff{core::kMigrationInitialBackoffMs};
    std::chrono::milliseconds maxBackoff{core::kMigrationMaxBackoffMs};
    /// Per-attempt wait for the destination's response.
    std::chrono::milliseconds ackTimeout{core::kMigrationAckTimeoutMs};
};

/// @brief Liveness tunables.
struct HeartbeatSettings
{
    std::chrono::milliseconds interval{core::kHeartbeatIntervalMs};
    core::u32                 missThreshold{core::kHeartbeatMissThreshold};
    /// Misses must also span at least this long before a target is Lost.
    std::chrono::milliseconds minLostDuration{0};
    CoordinatorLossPolicy     followerOnCoordinatorLost{CoordinatorLossPolicy::ShutdownSelf};
    /// Entry node pings every peer and broadcasts shutdown when one is lost.
    bool                      peerMonitoring{true};
    /// Followers watch the entry node's pushed heartbeats.
    bool                      coordinatorMonitoring{true};
    std::chrono::milliseconds readinessTimeout{core::kReadinessTimeoutMs};
};

/// @brief Memory transfer tunables.
struct MigrationSettings
{
    MemoryStrategy  strategy{MemoryStrategy::Delta};
    bool            compression{true};
    ReturnSemantics semantics{ReturnSemantics::CallReturn};
    core::u64       maxMemoryPages{core::kDefaultMaxMemoryPages};
    RetrySettings   retry{};
};

/// @brief Immutable cluster configuration.
class ClusterConfig
{
public:
    /// @brief Fluent builder for ClusterConfig.
    class Builder
    {
    public:
        Builder& name(std::string clusterName);
        Builder& addNode(NodeConfig node);
        Builder& addNode(core::NodeId id, std::string address, core::u16 port);

        Builder& heartbeatInterval(std::chrono::milliseconds interval) noexcept;
        Builder& missThreshold(core::u32 misses) noexcept;
        Builder& minLostDuration(std::chrono::milliseconds duration) noexcept;
        Builder& coordinatorLossPolicy(CoordinatorLossPolicy policy) noexcept;
        Builder& peerMonitoring(bool enabled) noexcept;
        Builder& coordinatorMonitoring(bool enabled) noexcept;
        Builder& readinessTimeout(std::chrono::milliseconds timeout) noexcept;

        Builder& memoryStrategy(MemoryStrategy strategy) noexcept;
        Builder& memoryCompression(bool enabled) noexcept;
        Builder& returnSemantics(ReturnSemantics semantics) noexcept;
        Builder& maxMemoryPages(core::u64 pages) noexcept;
        Builder& retry(RetrySettings settings) noexcept;

        /// @brief Validates and freezes the configuration.
        [[nodiscard]] core::Expected<ClusterConfig> build() const;

    private:
        std::string             name_;
        std::vector<NodeConfig> nodes_;
        HeartbeatSettings       heartbeat_{};
        MigrationSettings       migration_{};
    };

    [[nodiscard]] const std::string       &name()      const noexcept { return name_; }
    [[nodiscard]] const NodeTable         &nodes()     const noexcept { return nodes_; }
    [[nodiscard]] const HeartbeatSettings &heartbeat() const noexcept { return heartbeat_; }
    [[nodiscard]] const MigrationSettings &migration() const noexcept { return migration_; }

private:
    friend class Builder;
    ClusterConfig() = default;

    std::string       name_;
    NodeTable         nodes_;
    HeartbeatSettings heartbeat_{};
    MigrationSettings migration_{};
};

} // namespace hop::cluster
