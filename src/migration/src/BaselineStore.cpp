/**
 * @file BaselineStore.cpp
 * @brief BaselineStore implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/BaselineStore.hpp>
#include <hop/core/Assert.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Log.hpp>
#include <hop/core/StateHash.hpp>

#include <algorithm>
#include <format>

namespace hop::migration {

std::optional<BaselineRecord> BaselineStore::find(const core::NodeId &peer) const
{
    std::lock_guard lock{_mutex};
    const auto it = _records.find(peer);
    if (it == _records.end())
        return std::nullopt;
    return it->second;
}

void BaselineStore::record(const core::NodeId &peer, core::u64 baselineId,
                           std::shared_ptr<const core::Bytes> image)
{
    HOP_VERIFY(image && !image->empty() && image->size() % core::kPageSize == 0);
    BaselineRecord rec{baselineId, hashPages(*image), std::move(image)};

    std::lock_guard lock{_mutex};
    _records.insert_or_assign(peer, std::move(rec));
}

void BaselineStore::invalidate(const core::NodeId &peer)
{
    std::lock_guard lock{_mutex};
    if (_records.erase(peer) != 0)
        core::Log::debug("delta", std::format("baseline for {} invalidated", peer));
}

void BaselineStore::clear()
{
    std::lock_guard lock{_mutex};
    _records.clear();
}

core::usize BaselineStore::size() const
{
    std::lock_guard lock{_mutex};
    return _records.size();
}

std::vector<core::u64> BaselineStore::hashPages(std::span<const core::byte> image)
{
    const core::usize pages = (image.size() + core::kPageSize - 1) / core::kPageSize;

    std::vector<core::u64> hashes;
    hashes.reserve(pages);
    for (core::usize i = 0; i < pages; ++i)
    {
        const auto offset = i * core::kPageSize;
        const auto length = std::min<core::usize>(core::kPageSize, image.size() - offset);
        hashes.push_back(core::StateHash::of(image.subspan(offset, length)));
    }
    return hashes;
}

} // namespace hop::migration
