// /////////////////////////////////////////////////////////////////////////////
/// @file MemoryImage.hpp
/// @brief Linear-memory payload: a full blob or a page delta.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <hop/serial/ISerializable.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Types.hpp>

#include <vector>

namespace hop::serial {

/// @brief One changed 64 KiB page of a delta image.
struct PagePatch
{
    core::u32   index{0};
    /// @c data holds a size-prefixed compressed page when set.
    bool        compressed{false};
    core::Bytes data;
};

/// @brief Full memory blob or a set of pages over an agreed baseline.
///
/// A full image carries the whole memory (raw or compressed).  A delta
/// image names the baseline it must be applied to and lists only pages
/// whose content differs from it; every page index is below
/// @ref pages.
class MemoryImage final : public ISerializable
{
public:
    enum class Kind : core::u8
    {
        Full  = 0,
        Delta = 1
    };

    MemoryImage() = default;
    ~MemoryImage() override = default;

    MemoryImage(const MemoryImage&) = default;
    MemoryImage(MemoryImage&&) noexcept = default;
    MemoryImage& operator=(const MemoryImage&) = default;
    MemoryImage& operator=(MemoryImage&&) noexcept = default;

    /// @brief Uncompressed full image; @p raw must be page aligned.
    [[nodiscard]] static MemoryImage full(core::Bytes raw);

    /// @brief Full image whose blob may be compressed.
    [[nodiscard]] static MemoryImage full(core::Bytes blob, bool compressed, core::u64 pages);

    /// @brief Delta over @p baselineId reconstructing @p pages pages.
    [[nodiscard]] static MemoryImage delta(core::u64 baselineId,
                                           core::u64 pages,
                                           std::vector<PagePatch> patches);

    [[nodiscard]] Kind      kind()       const noexcept { return kind_; }
    [[nodiscard]] bool      isFull()     const noexcept { return kind_ == Kind::Full; }
    [[nodiscard]] bool      isDelta()    const noexcept { return kind_ == Kind::Delta; }
    [[nodiscard]] core::u64 pages()      const noexcept { return pages_; }
    [[nodiscard]] core::u64 baselineId() const noexcept { return baselineId_; }
    [[nodiscard]] bool      compressed() const noexcept { return compressed_; }

    /// @brief Reconstructed size in bytes (pages * 64 KiB).
    [[nodiscard]] core::u64 byteSize() const noexcept { return pages_ * core::kPageSize; }

    [[nodiscard]] const core::Bytes            &blob()    const noexcept { return blob_; }
    [[nodiscard]] const std::vector<PagePatch> &patches() const noexcept { return patches_; }

    /// @brief Releases the full blob (ownership transfer to the receiver).
    [[nodiscard]] core::Bytes takeBlob() noexcept;

    /// @brief Bytes this image occupies on the wire, excluding framing.
    [[nodiscard]] core::usize payloadBytes() const noexcept;

    // ISerializable ──────────────────────────────────────────────────────────
    [[nodiscard]] core::Expected<void> serialize(ByteStream& stream) const override;
    [[nodiscard]] core::Expected<void> deserialize(ByteStream& stream) override;
    [[nodiscard]] core::usize serializedSize() const noexcept override;

private:
    Kind                   kind_{Kind::Full};
    core::u64              pages_{0};
    core::u64              baselineId_{0};
    bool                   compressed_{false};
    core::Bytes            blob_;
    std::vector<PagePatch> patches_;
};

} // namespace hop::serial
