/**
 * @file BaselineStore.hpp
 * @brief Per-peer memory baselines used for delta transfers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_BASELINE_STORE_HPP
    #define HOP_MIGRATION_BASELINE_STORE_HPP

#include <hop/core/Types.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace hop::migration {

/**
 * @brief Memory image both ends of a pair agreed on after their last
 *        successful migration, whichever direction it went.
 */
struct BaselineRecord
{
    core::u64                          baselineId{0};
    /// FNV-1a digest of every 64 KiB page of @c image.
    std::vector<core::u64>             pageHashes;
    std::shared_ptr<const core::Bytes> image;

    [[nodiscard]] core::u64 pages() const noexcept { return pageHashes.size(); }
};

/**
 * @class BaselineStore
 * @brief Thread-safe map peer → BaselineRecord.
 *
 * Written only after an acknowledged migration; invalidated whenever the
 * pair may have lost synchronisation.
 */
class BaselineStore
{
public:
    [[nodiscard]] std::optional<BaselineRecord> find(const core::NodeId &peer) const;

    /// @brief Replaces the record for @p peer; @p image must be page aligned.
    void record(const core::NodeId &peer, core::u64 baselineId, std::shared_ptr<const core::Bytes> image);

    void invalidate(const core::NodeId &peer);
    void clear();

    [[nodiscard]] core::usize size() const;

    /// @brief Digest of every 64 KiB page of @p image.
    [[nodiscard]] static std::vector<core::u64> hashPages(std::span<const core::byte> image);

private:
    mutable std::mutex                                 _mutex;
    std::unordered_map<core::NodeId, BaselineRecord>   _records;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_BASELINE_STORE_HPP
