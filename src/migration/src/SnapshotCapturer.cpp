/**
 * @file SnapshotCapturer.cpp
 * @brief SnapshotCapturer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/SnapshotCapturer.hpp>
#include <hop/core/Constants.hpp>

#include <format>
#include <utility>

namespace hop::migration {

core::Expected<serial::ExecutionSnapshot> SnapshotCapturer::capture(std::vector<serial::CallFrame> callChain) const
{
    auto snapshot = _host.capture();
    if (!snapshot)
    {
        return core::makeError(core::ErrorCode::kCaptureFailure,
                               std::format("host capture failed: {}", snapshot.error().describe()));
    }

    const auto &memory = snapshot->memory();
    if (!memory.isFull() || memory.compressed())
    {
        return core::makeError(core::ErrorCode::kCaptureFailure, "host returned a non-raw memory image");
    }
    if (memory.blob().empty() || memory.blob().size() % core::kPageSize != 0)
    {
        return core::makeError(core::ErrorCode::kCaptureFailure,
                               std::format("linear memory of {} bytes is not a non-empty multiple of {}",
                                           memory.blob().size(), core::kPageSize));
    }

    return std::move(*snapshot).withCallChain(std::move(callChain));
}

} // namespace hop::migration
