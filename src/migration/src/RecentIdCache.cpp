/**
 * @file RecentIdCache.cpp
 * @brief RecentIdCache implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/RecentIdCache.hpp>

#include <algorithm>

namespace hop::migration {

RecentIdCache::RecentIdCache(core::usize capacity) : _capacity(std::max<core::usize>(capacity, 1))
{
}

std::optional<net::protocol::MigrationResponse> RecentIdCache::find(core::MigrationId id) const
{
    std::lock_guard lock{_mutex};
    const auto it = _responses.find(id);
    if (it == _responses.end())
        return std::nullopt;
    return it->second;
}

void RecentIdCache::insert(const net::protocol::MigrationResponse &response)
{
    if (!response.isAcknowledged())
        return;

    std::lock_guard lock{_mutex};
    if (_responses.insert_or_assign(response.migrationId, response).second)
        _order.push_back(response.migrationId);

    while (_order.size() > _capacity)
    {
        _responses.erase(_order.front());
        _order.pop_front();
    }
}

core::usize RecentIdCache::size() const
{
    std::lock_guard lock{_mutex};
    return _responses.size();
}

} // namespace hop::migration
