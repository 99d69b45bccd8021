// /////////////////////////////////////////////////////////////////////////////
/// @file Node.hpp
/// @brief Top-level node façade (Façade pattern).
///
/// Single entry-point that wires the subsystems of one cluster member:
/// transport, dispatcher, migration coordinator and liveness manager.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <hop/cluster/ClusterConfig.hpp>
#include <hop/liveness/LivenessManager.hpp>
#include <hop/migration/MigrationCoordinator.hpp>
#include <hop/net/transport/ITransport.hpp>
#include <hop/core/Expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace hop::node {

/// @brief One member of a migration cluster.
///
/// Owns every subsystem, initialises them in dependency order, blocks in
/// @ref run until a shutdown is requested (locally, by a peer, or by the
/// liveness policy), and shuts down cleanly.
///
/// The execution thread drives migration points through @ref migrateTo,
/// @ref enterFunction and @ref exitFunction; a failed migration is fatal
/// and requests a shutdown with the attributed reason.
class Node
{
public:
    /// @param self      This node's id (must appear in the node table).
    /// @param config    Immutable cluster configuration.
    /// @param host      Execution host, must outlive the node.
    /// @param transport Outbound transport; TCP when null.
    /// @param listener  Inbound listener; TCP on the configured port when null.
    Node(core::NodeId self,
         cluster::ClusterConfig config,
         migration::IExecutionHost& host,
         std::shared_ptr<net::transport::ITransport> transport = nullptr,
         std::unique_ptr<net::transport::IListener> listener = nullptr);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// @brief Opens the listener, waits for peer readiness (entry node)
    ///        and starts the liveness monitors.
    /// @return Success or the first error encountered.
    [[nodiscard]] core::Expected<void> init();

    /// @brief Entry node: execution is about to start on this cluster.
    void startExecution();

    /// @brief Migration point naming a destination node.
    [[nodiscard]] core::Expected<migration::MigrationOutcome> migrateTo(const core::NodeId& destination);

    /// @brief Function entry placed on @p target.
    [[nodiscard]] core::Expected<migration::MigrationOutcome> enterFunction(const core::NodeId& target,
                                                                           core::u32 stackHeight);

    /// @brief Function exit at @p stackHeight.
    [[nodiscard]] core::Expected<migration::MigrationOutcome> exitFunction(core::u32 stackHeight);

    /// @brief The program completed here: tells every peer, then stops.
    void programFinished();

    /// @brief Blocks until a shutdown is requested, then shuts down.
    void run();

    /// @brief Waits up to @p timeout for a shutdown request.
    [[nodiscard]] bool waitForShutdown(std::chrono::milliseconds timeout);

    /// @brief Request graceful shutdown (first reason wins).
    void requestShutdown(const std::string& reason);

    /// @brief Shut down all subsystems in reverse init order.
    void shutdown();

    [[nodiscard]] bool shutdownRequested() const noexcept;
    [[nodiscard]] std::string shutdownReason() const;

    [[nodiscard]] const core::NodeId& self() const noexcept;
    [[nodiscard]] const cluster::ClusterConfig& config() const noexcept;
    [[nodiscard]] bool isEntry() const noexcept;
    [[nodiscard]] net::transport::Endpoint endpoint() const;

    [[nodiscard]] migration::MigrationCoordinator& coordinator() noexcept;
    [[nodiscard]] liveness::LivenessManager& liveness() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hop::node
