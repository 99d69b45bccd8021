/**
 * @file PairLock.hpp
 * @brief FIFO mutual exclusion per ordered (source, destination) pair.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_PAIR_LOCK_HPP
    #define HOP_MIGRATION_PAIR_LOCK_HPP

#include <hop/core/NonCopyable.hpp>
#include <hop/core/Types.hpp>

#include <condition_variable>
#include <map>
#include <mutex>
#include <string>

namespace hop::migration {

/**
 * @brief Ticket lock keyed by node pair.
 *
 * Waiters for the same pair are served in arrival order; distinct pairs
 * never block each other.
 */
class PairLock final : public core::NonMovable<PairLock>
{
public:
    /// @brief Releases its pair on destruction.
    class Guard final : public core::NonCopyable<Guard>
    {
    public:
        Guard(Guard &&other) noexcept;
        Guard &operator=(Guard &&) = delete;
        ~Guard();

    private:
        friend class PairLock;
        Guard(PairLock &owner, std::string key) : _owner(&owner), _key(std::move(key)) {}

        PairLock   *_owner;
        std::string _key;
    };

    PairLock() = default;

    [[nodiscard]] Guard acquire(const core::NodeId &source, const core::NodeId &destination);

    /// @brief Number of migrations holding or waiting for this pair.
    [[nodiscard]] core::u64 queued(const core::NodeId &source, const core::NodeId &destination) const;

private:
    struct Tickets
    {
        core::u64 next{0};
        core::u64 serving{0};
    };

    void release(const std::string &key);

    static std::string keyOf(const core::NodeId &source, const core::NodeId &destination);

    mutable std::mutex             _mutex;
    std::condition_variable        _cv;
    std::map<std::string, Tickets> _pairs;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_PAIR_LOCK_HPP
