/**
 * @file MigrationTransport.hpp
 * @brief Reliable delivery of one migration request with bounded retries.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_NET_MIGRATION_TRANSPORT_HPP
    #define HOP_NET_MIGRATION_TRANSPORT_HPP

#include <hop/cluster/ClusterConfig.hpp>
#include <hop/net/PeerClient.hpp>

namespace hop::net {

/**
 * @brief Sends a MigrationRequest and waits for its response.
 *
 * The request is encoded once and the same bytes (same migration id) are
 * resent on every attempt.  Only network-level failures are retried, with
 * exponential backoff starting at @c initialBackoff, doubling, capped at
 * @c maxBackoff, for at most @c maxAttempts attempts.  A Rejected response
 * is a final answer and is returned as-is.
 *
 * Exhaustion yields kTransportFailure carrying the last network error.
 */
class MigrationTransport final {
public:
    MigrationTransport(const PeerClient &peers, cluster::RetrySettings retry);

    [[nodiscard]] core::Expected<protocol::MigrationResponse> send(
        const protocol::MigrationRequest &request) const;

    /// @brief Delay slept after failed attempt number @p attempt (1-based).
    [[nodiscard]] static std::chrono::milliseconds backoffAfter(const cluster::RetrySettings &retry,
                                                                core::u32 attempt) noexcept;

    [[nodiscard]] const cluster::RetrySettings &retry() const noexcept { return _retry; }

private:
    const PeerClient      &_peers;
    cluster::RetrySettings _retry;
};

} // namespace hop::net

#endif // HOP_NET_MIGRATION_TRANSPORT_HPP
