/**
 * @file DeltaEngine.hpp
 * @brief Builds and applies page-level memory deltas against peer baselines.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_DELTA_ENGINE_HPP
    #define HOP_MIGRATION_DELTA_ENGINE_HPP

#include <hop/migration/BaselineStore.hpp>
#include <hop/cluster/ClusterConfig.hpp>
#include <hop/serial/MemoryImage.hpp>
#include <hop/core/Expected.hpp>

#include <optional>
#include <span>

namespace hop::migration {

/**
 * @class DeltaEngine
 * @brief Memory delta encoder/decoder.
 *
 * Encoding (source side):
 *   - strategy Full, no local baseline for the peer, or a remote baseline
 *     id that differs from ours → Full image (compressed whole when that
 *     is smaller and compression is on);
 *   - otherwise → Delta: every page whose hash differs from the baseline
 *     hash, plus every page past the baseline's end, each compressed on
 *     its own.
 *
 * Decoding (destination side) overlays the patches on the retained
 * baseline image, truncated or zero-extended to the announced page count.
 * A delta over an unknown baseline fails with kBaselineMismatch.
 */
class DeltaEngine
{
public:
    DeltaEngine(BaselineStore &store, cluster::MigrationSettings settings);

    /**
     * @param peer            Destination node.
     * @param raw             Current linear memory, page aligned.
     * @param remoteBaseline  Baseline id the peer reported for us, if any.
     */
    [[nodiscard]] core::Expected<serial::MemoryImage> encode(const core::NodeId &peer,
                                                             std::span<const core::byte> raw,
                                                             std::optional<core::u64> remoteBaseline) const;

    /// @brief Full image of @p raw regardless of strategy and baselines.
    [[nodiscard]] core::Expected<serial::MemoryImage> encodeFull(std::span<const core::byte> raw) const;

    /// @brief Reconstructs the raw memory sent by @p peer.
    [[nodiscard]] core::Expected<core::Bytes> decode(const core::NodeId &peer, serial::MemoryImage image) const;

private:
    BaselineStore             &_store;
    cluster::MigrationSettings _settings;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_DELTA_ENGINE_HPP
