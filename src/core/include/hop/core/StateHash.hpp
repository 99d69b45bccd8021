/**
 * @file StateHash.hpp
 * @brief FNV-1a incremental hash for memory pages and module digests.
 *
 * The delta engine hashes every 64 KiB page of linear memory and compares
 * the digest with the baseline agreed with a peer; a mismatch marks the
 * page as dirty.  The same hasher fingerprints the executing module so a
 * destination can refuse snapshots produced by a different binary.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_CORE_STATE_HASH_HPP
    #define HOP_CORE_STATE_HASH_HPP

    #include "Types.hpp"

    #include <span>
    #include <type_traits>

namespace hop::core {

/**
 * @brief Incremental FNV-1a hasher.
 */
class StateHash final {
public:
    static constexpr u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr u64 kPrime       = 1099511628211ULL;

    constexpr StateHash() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    StateHash &hashBytes(std::span<const byte> data) noexcept
    {
        for (const auto b : data)
        {
            _hash ^= static_cast<u64>(b);
            _hash *= kPrime;
        }
        return *this;
    }

    /**
     * @brief Feed a trivially-copyable value into the hash.
     * @tparam T Trivially copyable type (page index, counters).
     * @param value Value to hash.
     * @return Reference to this hasher (for chaining).
     */
    template <typename T>
        requires std::is_trivially_copyable_v<T>
    StateHash &combine(const T &value) noexcept
    {
        const auto *ptr = reinterpret_cast<const byte *>(&value);
        return hashBytes({ptr, sizeof(T)});
    }

    /**
     * @brief Finalise and return the current digest.
     * @return 64-bit FNV-1a hash.
     */
    [[nodiscard]] constexpr u64 digest() const noexcept { return _hash; }

    /**
     * @brief Reset the hasher to its initial state.
     */
    constexpr void reset() noexcept { _hash = kOffsetBasis; }

    /**
     * @brief One-shot digest of @p data.
     */
    [[nodiscard]] static u64 of(std::span<const byte> data) noexcept
    {
        return StateHash{}.hashBytes(data).digest();
    }

private:
    u64 _hash = kOffsetBasis;
};

} // namespace hop::core

#endif // HOP_CORE_STATE_HASH_HPP
