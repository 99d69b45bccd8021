/**
 * @file NonCopyable.hpp
 * @brief CRTP base classes that delete copy (and optionally move) operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_CORE_NON_COPYABLE_HPP
    #define HOP_CORE_NON_COPYABLE_HPP

namespace hop::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

/**
 * @brief Inherit to pin an object in place (owners of threads, mutexes
 *        or sockets whose address is captured by workers).
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonMovable {
protected:
    NonMovable()  = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &)  = delete;
    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)       = delete;
};

} // namespace hop::core

#endif // HOP_CORE_NON_COPYABLE_HPP
