// /////////////////////////////////////////////////////////////////////////////
/// @file ByteStream.cpp
/// @brief ByteStream implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/serial/ByteStream.hpp>
#include <hop/core/Assert.hpp>

#include <format>

namespace hop::serial {

ByteStream::ByteStream() noexcept = default;

ByteStream::ByteStream(std::span<const core::byte> data) noexcept
    : view_{data}
    , readPos_{0}
    , readOnly_{true}
{}

ByteStream::~ByteStream() = default;

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

template <typename T>
void ByteStream::writeLe(T value)
{
    HOP_ASSERT(!readOnly_);

    for (core::usize i = 0; i < sizeof(T); ++i)
    {
        buffer_.push_back(static_cast<core::byte>((value >> (8 * i)) & 0xFFu));
    }
}

void ByteStream::writeBool(bool value)       { writeLe<core::u8>(value ? 1u : 0u); }
void ByteStream::writeU8(core::u8 value)     { writeLe(value); }
void ByteStream::writeU16(core::u16 value)   { writeLe(value); }
void ByteStream::writeU32(core::u32 value)   { writeLe(value); }
void ByteStream::writeU64(core::u64 value)   { writeLe(value); }

void ByteStream::reserve(core::usize bytes)
{
    HOP_ASSERT(!readOnly_);
    buffer_.reserve(bytes);
}

void ByteStream::writeBytes(std::span<const core::byte> bytes)
{
    HOP_ASSERT(!readOnly_);
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteStream::writeBlob(std::span<const core::byte> bytes)
{
    writeU32(static_cast<core::u32>(bytes.size()));
    writeBytes(bytes);
}

void ByteStream::writeString(std::string_view text)
{
    writeBlob({reinterpret_cast<const core::byte*>(text.data()), text.size()});
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

template <typename T>
core::Expected<T> ByteStream::readLe()
{
    const auto src = data();
    if (readPos_ + sizeof(T) > src.size())
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("ByteStream underflow reading {} bytes at offset {}",
                                           sizeof(T), readPos_));
    }

    T value = 0;
    for (core::usize i = 0; i < sizeof(T); ++i)
    {
        value |= static_cast<T>(static_cast<T>(src[readPos_ + i]) << (8 * i));
    }
    readPos_ += sizeof(T);
    return value;
}

core::Expected<bool> ByteStream::readBool()
{
    const auto v = HOP_TRY(readLe<core::u8>());
    if (v > 1)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed, "invalid boolean byte");
    }
    return v == 1;
}

core::Expected<core::u8>  ByteStream::readU8()  { return readLe<core::u8>(); }
core::Expected<core::u16> ByteStream::readU16() { return readLe<core::u16>(); }
core::Expected<core::u32> ByteStream::readU32() { return readLe<core::u32>(); }
core::Expected<core::u64> ByteStream::readU64() { return readLe<core::u64>(); }

core::Expected<core::Bytes> ByteStream::readBytes(core::usize count)
{
    const auto src = data();
    if (count > src.size() - readPos_)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("ByteStream underflow: need {} bytes, {} left",
                                           count, src.size() - readPos_));
    }

    const auto first = src.subspan(readPos_, count);
    readPos_ += count;
    return core::Bytes{first.begin(), first.end()};
}

core::Expected<core::Bytes> ByteStream::readBlob(core::usize maxSize)
{
    const auto size = HOP_TRY(readU32());
    if (size > maxSize)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("blob of {} bytes exceeds limit {}", size, maxSize));
    }
    return readBytes(size);
}

core::Expected<std::string> ByteStream::readString(core::usize maxSize)
{
    const auto raw = HOP_TRY(readBlob(maxSize));
    return std::string{reinterpret_cast<const char*>(raw.data()), raw.size()};
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::usize ByteStream::bytesWritten() const noexcept { return buffer_.size(); }

core::usize ByteStream::bytesRemaining() const noexcept
{
    const auto total = data().size();
    return (total > readPos_) ? total - readPos_ : 0;
}

std::span<const core::byte> ByteStream::data() const noexcept
{
    return readOnly_ ? view_ : std::span<const core::byte>{buffer_};
}

core::Bytes ByteStream::release() noexcept
{
    readPos_ = 0;
    core::Bytes out;
    out.swap(buffer_);
    return out;
}

void ByteStream::reset() noexcept
{
    readPos_ = 0;
    if (!readOnly_)
    {
        buffer_.clear();
    }
}

} // namespace hop::serial
