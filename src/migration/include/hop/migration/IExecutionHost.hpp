/**
 * @file IExecutionHost.hpp
 * @brief Capability the instrumented program exposes to the engine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_IEXECUTION_HOST_HPP
    #define HOP_MIGRATION_IEXECUTION_HOST_HPP

#include <hop/serial/ExecutionSnapshot.hpp>
#include <hop/core/Expected.hpp>
#include <hop/core/Types.hpp>

namespace hop::migration {

/**
 * @brief Snapshot/restore hooks of the running module.
 *
 * @c capture is called on the execution thread at a migration point.
 * @c restore and @c resume are called on a transport worker when a
 * migration arrives; @c resume schedules execution from the restored
 * point and returns without waiting for it.
 */
class IExecutionHost {
public:
    virtual ~IExecutionHost() = default;

    /// @brief Stack, globals and full linear memory at the current point.
    [[nodiscard]] virtual core::Expected<serial::ExecutionSnapshot> capture() = 0;

    /// @brief Injects a validated snapshot whose memory is a full raw image.
    [[nodiscard]] virtual core::ExpectedVoid restore(serial::ExecutionSnapshot snapshot) = 0;

    /// @brief Continues execution from the restored point.
    [[nodiscard]] virtual core::ExpectedVoid resume() = 0;

    /// @brief Digest identifying the executing module; peers must agree.
    [[nodiscard]] virtual core::u64 moduleDigest() const noexcept = 0;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_IEXECUTION_HOST_HPP
