/**
 * @file StateRestorer.hpp
 * @brief Validates a reconstructed snapshot, injects it and resumes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_STATE_RESTORER_HPP
    #define HOP_MIGRATION_STATE_RESTORER_HPP

#include <hop/migration/IExecutionHost.hpp>

namespace hop::migration {

/**
 * @brief Destination-side counterpart of SnapshotCapturer.
 *
 * Expects a snapshot whose memory is a raw full image of exactly
 * pages × 64 KiB.  Every failure is kRestoreFailure.
 */
class StateRestorer
{
public:
    explicit StateRestorer(IExecutionHost &host) : _host(host) {}

    [[nodiscard]] core::ExpectedVoid restore(serial::ExecutionSnapshot snapshot) const;

private:
    IExecutionHost &_host;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_STATE_RESTORER_HPP
