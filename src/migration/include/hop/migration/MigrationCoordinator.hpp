/**
 * @file MigrationCoordinator.hpp
 * @brief Drives both ends of a live migration.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_MIGRATION_MIGRATION_COORDINATOR_HPP
    #define HOP_MIGRATION_MIGRATION_COORDINATOR_HPP

#include <hop/migration/BaselineStore.hpp>
#include <hop/migration/IExecutionHost.hpp>
#include <hop/cluster/ClusterConfig.hpp>
#include <hop/net/Dispatcher.hpp>
#include <hop/net/PeerClient.hpp>
#include <hop/core/Expected.hpp>
#include <hop/core/Types.hpp>

#include <memory>
#include <string_view>

namespace hop::migration {

/// @brief Source-side lifecycle of the latest outbound migration.
enum class SourceState : core::u8
{
    Idle,
    Capturing,
    Transferring,
    AwaitingAck,
    Completed,
    Failed
};

/// @brief Destination-side lifecycle of the latest inbound migration.
enum class DestinationState : core::u8
{
    Listening,
    Validating,
    Restoring,
    Resumed
};

/// @brief What the execution thread does after a migration point returns.
enum class MigrationOutcome : core::u8
{
    /// Target was this node: keep running.
    StayedLocal,
    /// Execution left; park until a migration brings it back.
    AwaitingReturn,
    /// Execution left for good; stop the local execution.
    Terminated
};

[[nodiscard]] std::string_view toString(SourceState state) noexcept;
[[nodiscard]] std::string_view toString(DestinationState state) noexcept;
[[nodiscard]] std::string_view toString(MigrationOutcome outcome) noexcept;

/// @brief Counters since construction.
struct MigrationStats
{
    core::u64 sent{0};
    core::u64 received{0};
    core::u64 duplicatesReplayed{0};
    core::u64 rejected{0};
    core::u64 failed{0};
    core::u64 fullImagesSent{0};
    core::u64 deltaImagesSent{0};
    core::u64 pagesSent{0};
};

/**
 * @brief Migration coordinator of one node.
 *
 * Source role (@ref migrateTo and the call-chain entry points) runs on the
 * execution thread and blocks until the destination answers.  At most one
 * migration per (self, destination) pair is in flight; later ones queue in
 * arrival order.
 *
 * Destination role (@ref handleMigrate) runs on transport workers.  A
 * migration id already acknowledged is answered from a bounded cache
 * without touching the host again.
 *
 * Failures are fatal for the execution and returned to the caller:
 * kCaptureFailure, kTransportFailure, kMigrationRejected.  A baseline
 * mismatch is recovered internally by resending the same migration with
 * a full memory image.
 */
class MigrationCoordinator
{
public:
    MigrationCoordinator(core::NodeId self,
                         const cluster::ClusterConfig &config,
                         IExecutionHost &host,
                         const net::PeerClient &peers);
    ~MigrationCoordinator();

    MigrationCoordinator(const MigrationCoordinator &) = delete;
    MigrationCoordinator &operator=(const MigrationCoordinator &) = delete;

    // ------ //  Source role  // ------ //

    /**
     * @brief Migration point: moves the execution to @p destination.
     * @return StayedLocal when @p destination is this node, otherwise the
     *         local follow-up dictated by the return semantics.
     */
    [[nodiscard]] core::Expected<MigrationOutcome> migrateTo(const core::NodeId &destination);

    /// @brief Entry into a function placed on @p target.
    [[nodiscard]] core::Expected<MigrationOutcome> enterFunction(const core::NodeId &target,
                                                                 core::u32 stackHeight);

    /// @brief Exit from a function; returns to the caller's node when it
    ///        closes a remote call.
    [[nodiscard]] core::Expected<MigrationOutcome> exitFunction(core::u32 stackHeight);

    // ------ //  Destination role  // ------ //

    [[nodiscard]] net::protocol::MigrationResponse handleMigrate(net::protocol::MigrationRequest request);
    [[nodiscard]] net::protocol::BaselineReply handleBaselineQuery(const net::protocol::BaselineQuery &query) const;

    /// @brief Installs the MigrateRequest and BaselineQuery handlers.
    void registerHandlers(net::Dispatcher &dispatcher);

    // ------ //  Cluster events  // ------ //

    /// @brief Drops the baseline shared with @p peer (restart, loss).
    void forgetPeer(const core::NodeId &peer);

    // ------ //  Observers  // ------ //

    [[nodiscard]] const core::NodeId &self() const noexcept;
    [[nodiscard]] SourceState sourceState() const noexcept;
    [[nodiscard]] DestinationState destinationState() const noexcept;

    /// @brief Whether the execution currently lives on this node.
    [[nodiscard]] bool hostsExecution() const noexcept;

    [[nodiscard]] MigrationStats stats() const noexcept;
    [[nodiscard]] const BaselineStore &baselines() const noexcept;
    [[nodiscard]] std::vector<serial::CallFrame> callChain() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_MIGRATION_COORDINATOR_HPP
