/**
 * @file SnapshotCapturer.hpp
 * @brief Captures and validates the execution state at a migration point.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_SNAPSHOT_CAPTURER_HPP
    #define HOP_MIGRATION_SNAPSHOT_CAPTURER_HPP

#include <hop/migration/IExecutionHost.hpp>

namespace hop::migration {

/**
 * @brief Runs synchronously on the execution thread.  Every failure,
 *        including an invalid snapshot from the host, is kCaptureFailure.
 */
class SnapshotCapturer
{
public:
    explicit SnapshotCapturer(IExecutionHost &host) : _host(host) {}

    /// @brief Captures the host state and attaches @p callChain.
    [[nodiscard]] core::Expected<serial::ExecutionSnapshot> capture(std::vector<serial::CallFrame> callChain) const;

private:
    IExecutionHost &_host;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_SNAPSHOT_CAPTURER_HPP
