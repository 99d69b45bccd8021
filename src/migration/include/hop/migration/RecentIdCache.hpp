/**
 * @file RecentIdCache.hpp
 * @brief Bounded FIFO of answered migration ids.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_RECENT_ID_CACHE_HPP
    #define HOP_MIGRATION_RECENT_ID_CACHE_HPP

#include <hop/net/protocol/Messages.hpp>
#include <hop/core/Constants.hpp>

#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace hop::migration {

/**
 * @brief Remembers the acknowledgment sent for the last @c capacity
 *        migrations so a retried request is answered without restoring
 *        twice.  The oldest entry is evicted first.
 */
class RecentIdCache
{
public:
    explicit RecentIdCache(core::usize capacity = core::kRecentMigrationCapacity);

    [[nodiscard]] std::optional<net::protocol::MigrationResponse> find(core::MigrationId id) const;

    /// @brief Stores @p response; only acknowledgments are kept.
    void insert(const net::protocol::MigrationResponse &response);

    [[nodiscard]] core::usize size() const;
    [[nodiscard]] core::usize capacity() const noexcept { return _capacity; }

private:
    const core::usize                                                      _capacity;
    mutable std::mutex                                                     _mutex;
    std::deque<core::MigrationId>                                          _order;
    std::unordered_map<core::MigrationId, net::protocol::MigrationResponse> _responses;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_RECENT_ID_CACHE_HPP
