/**
 * @file PageCodec.hpp
 * @brief LZ4 compression of memory blobs and pages.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_PAGE_CODEC_HPP
    #define HOP_MIGRATION_PAGE_CODEC_HPP

#include <hop/core/Expected.hpp>
#include <hop/core/Types.hpp>

#include <span>

namespace hop::migration {

/**
 * @class PageCodec
 * @brief Stateless LZ4 block encoder/decoder.
 *
 * Compressed layout: [uncompressedSize:u32 LE][LZ4 block].
 */
class PageCodec
{
public:
    /// @brief Result of @ref encodeIfSmaller.
    struct Encoded
    {
        core::Bytes data;
        bool        compressed{false};
    };

    [[nodiscard]] static core::Expected<core::Bytes> compress(std::span<const core::byte> raw);

    /**
     * @brief Inflates @p packed.
     * @param maxSize Upper bound on the announced uncompressed size.
     */
    [[nodiscard]] static core::Expected<core::Bytes> decompress(std::span<const core::byte> packed,
                                                                core::usize maxSize);

    /// @brief Compressed form when strictly smaller than @p raw, otherwise a raw copy.
    [[nodiscard]] static core::Expected<Encoded> encodeIfSmaller(std::span<const core::byte> raw);
};

} // namespace hop::migration

#endif // HOP_MIGRATION_PAGE_CODEC_HPP
