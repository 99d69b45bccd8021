// /////////////////////////////////////////////////////////////////////////////
/// @file ClusterConfig.cpp
/// @brief ClusterConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/cluster/ClusterConfig.hpp>

namespace hop::cluster {

std::string_view toString(CoordinatorLossPolicy policy) noexcept
{
    return policy == CoordinatorLossPolicy::ShutdownSelf ? "shutdown_self" : "ignore";
}

std::string_view toString(MemoryStrategy strategy) noexcept
{
    return strategy == MemoryStrategy::Delta ? "delta" : "full";
}

ClusterConfig::Builder& ClusterConfig::Builder::name(std::string clusterName)
{
    name_ = std::move(clusterName);
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::addNode(NodeConfig node)
{
    nodes_.push_back(std::move(node));
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::addNode(core::NodeId id, std::string address, core::u16 port)
{
    return addNode(NodeConfig{std::move(id), std::move(address), port, std::nullopt});
}

ClusterConfig::Builder& ClusterConfig::Builder::heartbeatInterval(std::chrono::milliseconds interval) noexcept
{
    heartbeat_.interval = interval;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::missThreshold(core::u32 misses) noexcept
{
    heartbeat_.missThreshold = misses;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::coordinatorLossPolicy(CoordinatorLossPolicy policy) noexcept
{
    heartbeat_.followerOnCoordinatorLost = policy;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::peerMonitoring(bool enabled) noexcept
{
    heartbeat_.peerMonitoring = enabled;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::coordinatorMonitoring(bool enabled) noexcept
{
    heartbeat_.coordinatorMonitoring = enabled;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::minLostDuration(std::chrono::milliseconds duration) noexcept
{
    heartbeat_.minLostDuration = duration;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::readinessTimeout(std::chrono::milliseconds timeout) noexcept
{
    heartbeat_.readinessTimeout = timeout;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::memoryStrategy(MemoryStrategy strategy) noexcept
{
    migration_.strategy = strategy;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::memoryCompression(bool enabled) noexcept
{
    migration_.compression = enabled;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::returnSemantics(ReturnSemantics semantics) noexcept
{
    migration_.semantics = semantics;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::maxMemoryPages(core::u64 pages) noexcept
{
    migration_.maxMemoryPages = pages;
    return *this;
}

ClusterConfig::Builder& ClusterConfig::Builder::retry(RetrySettings settings) noexcept
{
    migration_.retry = settings;
    return *this;
}

core::Expected<ClusterConfig> ClusterConfig::Builder::build() const
{
    if (name_.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "cluster name must not be empty");
    }
    if (heartbeat_.interval.count() <= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "heartbeat interval must be positive");
    }
    if (heartbeat_.missThreshold == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "heartbeat miss threshold must be non-zero");
    }
    if (heartbeat_.minLostDuration.count() < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "minimum lost duration must not be negative");
    }
    if (migration_.retry.maxAttempts == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "migration retry budget must be non-zero");
    }
    if (migration_.maxMemoryPages == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "max memory pages must be non-zero");
    }

    auto table = NodeTable::create(nodes_);
    if (!table)
    {
        return std::unexpected(std::move(table.error()));
    }

    ClusterConfig cfg;
    cfg.name_      = name_;
    cfg.nodes_     = std::move(*table);
    cfg.heartbeat_ = heartbeat_;
    cfg.migration_ = migration_;
    return cfg;
}

} // namespace hop::cluster
