/**
 * @file DeltaEngine.cpp
 * @brief DeltaEngine implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/DeltaEngine.hpp>
#include <hop/migration/PageCodec.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Log.hpp>
#include <hop/core/StateHash.hpp>

#include <algorithm>
#include <format>

namespace hop::migration {

namespace {

core::ExpectedVoid checkAligned(std::span<const core::byte> raw)
{
    if (raw.empty() || raw.size() % core::kPageSize != 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("memory of {} bytes is not a non-empty multiple of {}",
                                           raw.size(), core::kPageSize));
    }
    return {};
}

} // namespace

DeltaEngine::DeltaEngine(BaselineStore &store, cluster::MigrationSettings settings)
    : _store(store), _settings(settings)
{
}

core::Expected<serial::MemoryImage> DeltaEngine::encodeFull(std::span<const core::byte> raw) const
{
    HOP_TRY_VOID(checkAligned(raw));
    const core::u64 pages = raw.size() / core::kPageSize;

    if (!_settings.compression)
        return serial::MemoryImage::full(core::Bytes(raw.begin(), raw.end()), false, pages);

    auto encoded = HOP_TRY(PageCodec::encodeIfSmaller(raw));
    return serial::MemoryImage::full(std::move(encoded.data), encoded.compressed, pages);
}

core::Expected<serial::MemoryImage> DeltaEngine::encode(const core::NodeId &peer,
                                                        std::span<const core::byte> raw,
                                                        std::optional<core::u64> remoteBaseline) const
{
    HOP_TRY_VOID(checkAligned(raw));

    if (_settings.strategy == cluster::MemoryStrategy::Full)
        return encodeFull(raw);

    const auto baseline = _store.find(peer);
    if (!baseline || !remoteBaseline || *remoteBaseline != baseline->baselineId)
    {
        if (baseline)
        {
            core::Log::info("delta", std::format("baseline {} for {} not held remotely, sending full image",
                                                 baseline->baselineId, peer));
        }
        return encodeFull(raw);
    }

    const core::u64 pages = raw.size() / core::kPageSize;
    std::vector<serial::PagePatch> patches;
    for (core::u64 i = 0; i < pages; ++i)
    {
        const auto page = raw.subspan(i * core::kPageSize, core::kPageSize);
        if (i < baseline->pages() && core::StateHash::of(page) == baseline->pageHashes[i])
            continue;

        serial::PagePatch patch;
        patch.index = static_cast<core::u32>(i);
        if (_settings.compression)
        {
            auto encoded = HOP_TRY(PageCodec::encodeIfSmaller(page));
            patch.compressed = encoded.compressed;
            patch.data       = std::move(encoded.data);
        }
        else
        {
            patch.data.assign(page.begin(), page.end());
        }
        patches.push_back(std::move(patch));
    }

    core::Log::debug("delta", std::format("delta for {}: {}/{} pages changed over baseline {}",
                                          peer, patches.size(), pages, baseline->baselineId));
    return serial::MemoryImage::delta(baseline->baselineId, pages, std::move(patches));
}

core::Expected<core::Bytes> DeltaEngine::decode(const core::NodeId &peer, serial::MemoryImage image) const
{
    const core::u64 pages = image.pages();
    if (pages == 0)
        return core::makeError(core::ErrorCode::kCorruptedData, "memory image has zero pages");

    const core::usize byteSize = pages * core::kPageSize;

    if (image.isFull())
    {
        core::Bytes blob;
        if (image.compressed())
            blob = HOP_TRY(PageCodec::decompress(image.blob(), byteSize));
        else
            blob = image.takeBlob();
        if (blob.size() != byteSize)
        {
            return core::makeError(core::ErrorCode::kCorruptedData,
                                   std::format("full image holds {} bytes, expected {}", blob.size(), byteSize));
        }
        return blob;
    }

    const auto baseline = _store.find(peer);
    if (!baseline || baseline->baselineId != image.baselineId())
    {
        return core::makeError(core::ErrorCode::kBaselineMismatch,
                               std::format("delta from {} over baseline {}, holding {}", peer,
                                           image.baselineId(),
                                           baseline ? std::to_string(baseline->baselineId) : "none"));
    }

    core::Bytes memory(baseline->image->begin(),
                       baseline->image->begin()
                           + static_cast<std::ptrdiff_t>(std::min<core::usize>(byteSize, baseline->image->size())));
    memory.resize(byteSize);

    for (const auto &patch : image.patches())
    {
        if (patch.index >= pages)
        {
            return core::makeError(core::ErrorCode::kCorruptedData,
                                   std::format("page {} outside image of {} pages", patch.index, pages));
        }

        core::Bytes inflated;
        std::span<const core::byte> page = patch.data;
        if (patch.compressed)
        {
            inflated = HOP_TRY(PageCodec::decompress(patch.data, core::kPageSize));
            page = inflated;
        }
        if (page.size() != core::kPageSize)
        {
            return core::makeError(core::ErrorCode::kCorruptedData,
                                   std::format("page {} holds {} bytes", patch.index, page.size()));
        }
        std::ranges::copy(page, memory.begin() + static_cast<std::ptrdiff_t>(patch.index * core::kPageSize));
    }
    return memory;
}

} // namespace hop::migration
