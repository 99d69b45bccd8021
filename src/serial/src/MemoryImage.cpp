// /////////////////////////////////////////////////////////////////////////////
/// @file MemoryImage.cpp
/// @brief MemoryImage construction and wire encoding.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/serial/MemoryImage.hpp>
#include <hop/serial/ByteStream.hpp>

#include <format>

namespace hop::serial {

MemoryImage MemoryImage::full(core::Bytes raw)
{
    const core::u64 pages = (raw.size() + core::kPageSize - 1) / core::kPageSize;
    return full(std::move(raw), false, pages);
}

MemoryImage MemoryImage::full(core::Bytes blob, bool compressed, core::u64 pages)
{
    MemoryImage img;
    img.kind_       = Kind::Full;
    img.pages_      = pages;
    img.compressed_ = compressed;
    img.blob_       = std::move(blob);
    return img;
}

MemoryImage MemoryImage::delta(core::u64 baselineId, core::u64 pages, std::vector<PagePatch> patches)
{
    MemoryImage img;
    img.kind_       = Kind::Delta;
    img.pages_      = pages;
    img.baselineId_ = baselineId;
    img.patches_    = std::move(patches);
    return img;
}

core::Bytes MemoryImage::takeBlob() noexcept
{
    core::Bytes out;
    out.swap(blob_);
    return out;
}

core::usize MemoryImage::payloadBytes() const noexcept
{
    core::usize total = blob_.size();
    for (const auto &p : patches_)
    {
        total += p.data.size();
    }
    return total;
}

core::Expected<void> MemoryImage::serialize(ByteStream& stream) const
{
    stream.writeU8(static_cast<core::u8>(kind_));
    stream.writeU64(pages_);

    if (kind_ == Kind::Full)
    {
        if (blob_.size() > core::kMaxMessageSize)
        {
            return core::makeError(core::ErrorCode::kMessageTooLarge,
                                   std::format("memory blob of {} bytes exceeds the message limit",
                                               blob_.size()));
        }
        stream.writeBool(compressed_);
        stream.writeBlob(blob_);
        return {};
    }

    stream.writeU64(baselineId_);
    stream.writeU32(static_cast<core::u32>(patches_.size()));
    for (const auto &p : patches_)
    {
        stream.writeU32(p.index);
        stream.writeBool(p.compressed);
        stream.writeBlob(p.data);
    }
    return {};
}

core::usize MemoryImage::serializedSize() const noexcept
{
    // kind + page count
    core::usize size = 1 + 8;
    if (kind_ == Kind::Full)
        return size + 1 + 4 + blob_.size();

    size += 8 + 4;
    for (const auto &p : patches_)
    {
        size += 4 + 1 + 4 + p.data.size();
    }
    return size;
}

core::Expected<void> MemoryImage::deserialize(ByteStream& stream)
{
    const auto kind = HOP_TRY(stream.readU8());
    if (kind > static_cast<core::u8>(Kind::Delta))
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("unknown memory image kind {}", kind));
    }

    kind_  = static_cast<Kind>(kind);
    pages_ = HOP_TRY(stream.readU64());
    blob_.clear();
    patches_.clear();
    baselineId_ = 0;
    compressed_ = false;

    if (kind_ == Kind::Full)
    {
        compressed_ = HOP_TRY(stream.readBool());
        blob_       = HOP_TRY(stream.readBlob(core::kMaxMessageSize));
        return {};
    }

    baselineId_ = HOP_TRY(stream.readU64());
    const auto count = HOP_TRY(stream.readU32());
    if (count > pages_)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("delta lists {} pages but image has {}", count, pages_));
    }

    // index + compressed flag + blob length, before any page byte.
    constexpr core::usize kMinPatchBytes = 4 + 1 + 4;
    if (static_cast<core::u64>(count) * kMinPatchBytes > stream.bytesRemaining())
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("delta lists {} pages but only {} bytes follow", count,
                                           stream.bytesRemaining()));
    }

    // A compressed page is only kept when smaller than the raw page.
    constexpr core::usize kMaxPatchBytes = core::kPageSize + 64;

    patches_.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
    {
        PagePatch p;
        p.index      = HOP_TRY(stream.readU32());
        p.compressed = HOP_TRY(stream.readBool());
        p.data       = HOP_TRY(stream.readBlob(kMaxPatchBytes));
        patches_.push_back(std::move(p));
    }
    return {};
}

} // namespace hop::serial
