/**
 * @file Expected.hpp
 * @brief Result type returned by every fallible hop operation.
 *
 * A capture, a frame decode or a peer request either yields its value or
 * an Error carrying the code the caller branches on (retry a transport
 * failure, fall back to a full image on a baseline mismatch, ...).
 *
 * @code
 *   core::Expected<Frame> PeerClient::call(...)
 *   {
 *       const auto endpoint = HOP_TRY(endpointOf(destination));
 *       HOP_TRY_VOID(validate(frame));
 *       return transport->request(endpoint, frame, timeout);
 *   }
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_CORE_EXPECTED_HPP
    #define HOP_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace hop::core {

/// @brief Value of type @p T or the Error explaining its absence.
template <typename T>
using Expected = std::expected<T, Error>;

/// @brief Success without a value.
using ExpectedVoid = Expected<void>;

} // namespace hop::core

/**
 * @brief Unwraps an Expected or returns its error from the enclosing
 *        function.
 *
 * GNU statement expression: @p expr is evaluated exactly once and the
 * macro's value is the moved-out success value.
 */
#define HOP_TRY(expr)                                                     \
    ({                                                                     \
        auto &&hop_try_result_ = (expr);                                   \
        if (!hop_try_result_) [[unlikely]]                                 \
            return ::std::unexpected(::std::move(hop_try_result_).error()); \
        ::std::move(hop_try_result_).value();                              \
    })

/**
 * @brief Returns the error of @p expr from the enclosing function, if any.
 */
#define HOP_TRY_VOID(expr)                                                \
    do {                                                                   \
        if (auto &&hop_try_result_ = (expr); !hop_try_result_) [[unlikely]] \
            return ::std::unexpected(::std::move(hop_try_result_).error()); \
    } while (false)

#endif // HOP_CORE_EXPECTED_HPP
