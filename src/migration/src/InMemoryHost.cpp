/**
 * @file InMemoryHost.cpp
 * @brief InMemoryHost implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/InMemoryHost.hpp>
#include <hop/core/Constants.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace hop::migration {

InMemoryHost::InMemoryHost(core::u64 moduleDigest, core::u64 memoryPages)
    : _digest(moduleDigest), _memory(memoryPages * core::kPageSize)
{
}

core::Expected<serial::ExecutionSnapshot> InMemoryHost::capture()
{
    std::lock_guard lock{_mutex};
    if (_captureFault)
    {
        auto reason = std::exchange(_captureFault, std::nullopt);
        return core::makeError(core::ErrorCode::kCaptureFailure, std::move(*reason));
    }
    return serial::ExecutionSnapshot{_stack, _globals, serial::MemoryImage::full(_memory)};
}

core::ExpectedVoid InMemoryHost::restore(serial::ExecutionSnapshot snapshot)
{
    std::lock_guard lock{_mutex};
    if (_restoreFault)
    {
        auto reason = std::exchange(_restoreFault, std::nullopt);
        return core::makeError(core::ErrorCode::kRestoreFailure, std::move(*reason));
    }

    auto memory = snapshot.takeMemory();
    if (!memory.isFull() || memory.compressed())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "host expects a raw full memory image");
    }

    _stack   = snapshot.stackState();
    _globals = snapshot.globals();
    _memory  = memory.takeBlob();
    ++_restores;
    return {};
}

core::ExpectedVoid InMemoryHost::resume()
{
    std::function<void()> callback;
    {
        std::lock_guard lock{_mutex};
        _running = true;
        ++_resumes;
        callback = _onResume;
    }
    if (callback)
        callback();
    return {};
}

void InMemoryHost::setStack(core::Bytes stack)
{
    std::lock_guard lock{_mutex};
    _stack = std::move(stack);
}

void InMemoryHost::setGlobals(std::vector<serial::GlobalValue> globals)
{
    std::lock_guard lock{_mutex};
    _globals = std::move(globals);
}

core::ExpectedVoid InMemoryHost::writeMemory(core::usize offset, std::span<const core::byte> data)
{
    std::lock_guard lock{_mutex};
    if (offset > _memory.size() || data.size() > _memory.size() - offset)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               std::format("write of {} bytes at {} exceeds memory of {} bytes",
                                           data.size(), offset, _memory.size()));
    }
    std::ranges::copy(data, _memory.begin() + static_cast<std::ptrdiff_t>(offset));
    return {};
}

void InMemoryHost::resizeMemory(core::u64 pages)
{
    std::lock_guard lock{_mutex};
    _memory.resize(pages * core::kPageSize);
}

core::Bytes InMemoryHost::stack() const
{
    std::lock_guard lock{_mutex};
    return _stack;
}

std::vector<serial::GlobalValue> InMemoryHost::globals() const
{
    std::lock_guard lock{_mutex};
    return _globals;
}

core::Bytes InMemoryHost::memory() const
{
    std::lock_guard lock{_mutex};
    return _memory;
}

bool InMemoryHost::running() const
{
    std::lock_guard lock{_mutex};
    return _running;
}

void InMemoryHost::park()
{
    std::lock_guard lock{_mutex};
    _running = false;
}

core::u32 InMemoryHost::restoreCount() const
{
    std::lock_guard lock{_mutex};
    return _restores;
}

core::u32 InMemoryHost::resumeCount() const
{
    std::lock_guard lock{_mutex};
    return _resumes;
}

void InMemoryHost::failNextCapture(std::string reason)
{
    std::lock_guard lock{_mutex};
    _captureFault = std::move(reason);
}

void InMemoryHost::failNextRestore(std::string reason)
{
    std::lock_guard lock{_mutex};
    _restoreFault = std::move(reason);
}

void InMemoryHost::onResume(std::function<void()> callback)
{
    std::lock_guard lock{_mutex};
    _onResume = std::move(callback);
}

} // namespace hop::migration
