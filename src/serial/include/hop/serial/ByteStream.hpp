// /////////////////////////////////////////////////////////////////////////////
/// @file ByteStream.hpp
/// @brief Byte-aligned serialization stream for the migration wire format.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hop/core/Types.hpp>
#include <hop/core/Expected.hpp>
#include <hop/core/NonCopyable.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hop::serial {

// /////////////////////////////////////////////////////////////////////////////
/// @class ByteStream
/// @brief Compact read/write stream with fixed-width little-endian fields.
///
/// A default-constructed stream is writable and owns its buffer.  A stream
/// constructed over an existing span is read-only and never copies the
/// input, which matters for multi-megabyte memory images.  Every read is
/// bounds-checked and reports @c kDeserializationFailed on underflow.
// /////////////////////////////////////////////////////////////////////////////
class ByteStream final : public core::NonCopyable<ByteStream>
{
public:
    /// @brief Constructs an empty writable stream.
    ByteStream() noexcept;

    /// @brief Constructs a read-only stream over @p data (not copied).
    explicit ByteStream(std::span<const core::byte> data) noexcept;

    ~ByteStream();

    ByteStream(ByteStream&&) noexcept = default;
    ByteStream& operator=(ByteStream&&) noexcept = default;

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Grows the write buffer capacity to at least @p bytes.
    void reserve(core::usize bytes);

    void writeBool(bool value);
    void writeU8(core::u8 value);
    void writeU16(core::u16 value);
    void writeU32(core::u32 value);
    void writeU64(core::u64 value);

    /// @brief Writes raw bytes without a length prefix.
    void writeBytes(std::span<const core::byte> bytes);

    /// @brief Writes a u32 length prefix followed by the bytes.
    void writeBlob(std::span<const core::byte> bytes);

    /// @brief Writes a u32 length prefix followed by UTF-8 text.
    void writeString(std::string_view text);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<bool>      readBool();
    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::u64> readU64();

    /// @brief Reads @p count raw bytes.
    [[nodiscard]] core::Expected<core::Bytes> readBytes(core::usize count);

    /// @brief Reads a length-prefixed blob no longer than @p maxSize.
    [[nodiscard]] core::Expected<core::Bytes> readBlob(core::usize maxSize);

    /// @brief Reads a length-prefixed string no longer than @p maxSize.
    [[nodiscard]] core::Expected<std::string> readString(core::usize maxSize = 4096);

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Returns the number of written bytes.
    [[nodiscard]] core::usize bytesWritten() const noexcept;

    /// @brief Returns the number of bytes remaining for reading.
    [[nodiscard]] core::usize bytesRemaining() const noexcept;

    /// @brief Returns the readable bytes (written buffer or wrapped span).
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /// @brief Moves the written buffer out, leaving the stream empty.
    [[nodiscard]] core::Bytes release() noexcept;

    /// @brief Resets read/write cursors to the beginning.
    void reset() noexcept;

private:
    template <typename T>
    void writeLe(T value);

    template <typename T>
    [[nodiscard]] core::Expected<T> readLe();

    core::Bytes                 buffer_;
    std::span<const core::byte> view_;
    core::usize                 readPos_{0};
    bool                        readOnly_{false};
};

} // namespace hop::serial
