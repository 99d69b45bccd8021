/**
 * @file PageCodec.cpp
 * @brief PageCodec implementation over the LZ4 block format.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/PageCodec.hpp>

#include <lz4.h>

#include <format>

namespace hop::migration {

namespace {

constexpr core::usize kSizePrefix = 4;

} // namespace

core::Expected<core::Bytes> PageCodec::compress(std::span<const core::byte> raw)
{
    if (raw.size() > static_cast<core::usize>(LZ4_MAX_INPUT_SIZE))
    {
        return core::makeError(core::ErrorCode::kCompressionFailed,
                               std::format("blob of {} bytes too large to compress", raw.size()));
    }

    const int rawSize = static_cast<int>(raw.size());
    const int bound = ::LZ4_compressBound(rawSize);
    core::Bytes out(kSizePrefix + static_cast<core::usize>(bound));

    const auto size = static_cast<core::u32>(raw.size());
    for (core::usize i = 0; i < kSizePrefix; ++i)
        out[i] = static_cast<core::byte>((size >> (8 * i)) & 0xFF);

    const int packedSize = ::LZ4_compress_default(reinterpret_cast<const char *>(raw.data()),
                                                  reinterpret_cast<char *>(out.data() + kSizePrefix), rawSize, bound);
    if (packedSize <= 0 && rawSize > 0)
    {
        return core::makeError(core::ErrorCode::kCompressionFailed,
                               std::format("LZ4_compress_default failed ({})", packedSize));
    }

    out.resize(kSizePrefix + static_cast<core::usize>(packedSize));
    return out;
}

core::Expected<core::Bytes> PageCodec::decompress(std::span<const core::byte> packed, core::usize maxSize)
{
    if (packed.size() < kSizePrefix)
    {
        return core::makeError(core::ErrorCode::kDecompressionFailed, "compressed blob shorter than its header");
    }

    core::u32 size = 0;
    for (core::usize i = 0; i < kSizePrefix; ++i)
        size |= static_cast<core::u32>(packed[i]) << (8 * i);

    if (size > maxSize || size > static_cast<core::u32>(LZ4_MAX_INPUT_SIZE))
    {
        return core::makeError(core::ErrorCode::kDecompressionFailed,
                               std::format("announced size {} exceeds limit {}", size, maxSize));
    }
    if (packed.size() - kSizePrefix > static_cast<core::usize>(LZ4_compressBound(static_cast<int>(size))))
    {
        return core::makeError(core::ErrorCode::kDecompressionFailed,
                               std::format("{} compressed bytes cannot expand to {}", packed.size() - kSizePrefix,
                                           size));
    }

    core::Bytes out(size);
    const int written = ::LZ4_decompress_safe(reinterpret_cast<const char *>(packed.data() + kSizePrefix),
                                              reinterpret_cast<char *>(out.data()),
                                              static_cast<int>(packed.size() - kSizePrefix), static_cast<int>(size));
    if (written < 0 || static_cast<core::u32>(written) != size)
    {
        return core::makeError(core::ErrorCode::kDecompressionFailed,
                               std::format("LZ4_decompress_safe failed ({}), expected {} bytes", written, size));
    }
    return out;
}

core::Expected<PageCodec::Encoded> PageCodec::encodeIfSmaller(std::span<const core::byte> raw)
{
    auto packed = HOP_TRY(compress(raw));
    if (packed.size() < raw.size())
        return Encoded{std::move(packed), true};
    return Encoded{core::Bytes(raw.begin(), raw.end()), false};
}

} // namespace hop::migration
