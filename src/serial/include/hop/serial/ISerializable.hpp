/**
 * @file ISerializable.hpp
 * @brief Wire contract of the migration payload types.
 *
 * MemoryImage and ExecutionSnapshot write themselves into a ByteStream
 * (little-endian, length-prefixed blobs) and read themselves back,
 * rejecting truncated or inconsistent input with kCorruptedData.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_SERIAL_ISERIALIZABLE_HPP
    #define HOP_SERIAL_ISERIALIZABLE_HPP

#include <hop/core/Types.hpp>
#include <hop/core/Expected.hpp>

namespace hop::serial {

class ByteStream;

/** @brief A value that can travel inside a migration frame. */
class ISerializable
{
public:
    virtual ~ISerializable() = default;

    /// @brief Appends the encoded value to @p out.
    [[nodiscard]] virtual core::ExpectedVoid serialize(ByteStream& out) const = 0;

    /// @brief Replaces this value with the one decoded from @p in.
    /// @note On failure the object is left unspecified and must be discarded.
    [[nodiscard]] virtual core::ExpectedVoid deserialize(ByteStream& in) = 0;

    /** @brief Exact encoded size, used to reserve the output buffer. */
    [[nodiscard]] virtual core::usize serializedSize() const noexcept = 0;

protected:
    ISerializable() = default;
    ISerializable(const ISerializable&) = default;
    ISerializable(ISerializable&&) noexcept = default;
    ISerializable& operator=(const ISerializable&) = default;
    ISerializable& operator=(ISerializable&&) noexcept = default;
};

} // namespace hop::serial

#endif // HOP_SERIAL_ISERIALIZABLE_HPP
