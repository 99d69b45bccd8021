/**
 * @file StateRestorer.cpp
 * @brief StateRestorer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/StateRestorer.hpp>
#include <hop/core/Constants.hpp>

#include <format>
#include <utility>

namespace hop::migration {

core::ExpectedVoid StateRestorer::restore(serial::ExecutionSnapshot snapshot) const
{
    const auto &memory = snapshot.memory();
    if (!memory.isFull() || memory.compressed())
        return core::makeError(core::ErrorCode::kRestoreFailure, "memory was not reconstructed");
    if (memory.pages() == 0)
        return core::makeError(core::ErrorCode::kRestoreFailure, "memory image has zero pages");
    if (memory.blob().size() != memory.byteSize())
    {
        return core::makeError(core::ErrorCode::kRestoreFailure,
                               std::format("memory holds {} bytes, expected {} pages ({} bytes)",
                                           memory.blob().size(), memory.pages(), memory.byteSize()));
    }

    if (auto injected = _host.restore(std::move(snapshot)); !injected)
    {
        return core::makeError(core::ErrorCode::kRestoreFailure,
                               std::format("host restore failed: {}", injected.error().describe()));
    }
    if (auto resumed = _host.resume(); !resumed)
    {
        return core::makeError(core::ErrorCode::kRestoreFailure,
                               std::format("host resume failed: {}", resumed.error().describe()));
    }
    return {};
}

} // namespace hop::migration
