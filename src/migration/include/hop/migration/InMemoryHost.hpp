/**
 * @file InMemoryHost.hpp
 * @brief Reference execution host keeping its state in plain buffers.
 *
 * Stands in for an instrumented module in tests and in the demo: the
 * "program" mutates stack, globals and linear memory through the
 * accessors below, and the engine captures / restores them.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_IN_MEMORY_HOST_HPP
    #define HOP_MIGRATION_IN_MEMORY_HOST_HPP

#include <hop/migration/IExecutionHost.hpp>
#include <hop/core/NonCopyable.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>

namespace hop::migration {

class InMemoryHost final : public IExecutionHost, public core::NonMovable<InMemoryHost> {
public:
    /// @param moduleDigest Digest reported to peers.
    /// @param memoryPages  Initial linear memory size, in 64 KiB pages.
    explicit InMemoryHost(core::u64 moduleDigest, core::u64 memoryPages = 1);
    ~InMemoryHost() override = default;

    // ------ //  IExecutionHost  // ------ //

    [[nodiscard]] core::Expected<serial::ExecutionSnapshot> capture() override;
    [[nodiscard]] core::ExpectedVoid restore(serial::ExecutionSnapshot snapshot) override;
    [[nodiscard]] core::ExpectedVoid resume() override;
    [[nodiscard]] core::u64 moduleDigest() const noexcept override { return _digest; }

    // ------ //  Program side  // ------ //

    void setStack(core::Bytes stack);
    void setGlobals(std::vector<serial::GlobalValue> globals);

    /// @brief Writes @p data at @p offset of linear memory.
    [[nodiscard]] core::ExpectedVoid writeMemory(core::usize offset, std::span<const core::byte> data);

    /// @brief Grows or shrinks linear memory to @p pages pages (new bytes are zero).
    void resizeMemory(core::u64 pages);

    [[nodiscard]] core::Bytes                      stack() const;
    [[nodiscard]] std::vector<serial::GlobalValue> globals() const;
    [[nodiscard]] core::Bytes                      memory() const;

    /// @brief Whether execution was resumed here and not parked since.
    [[nodiscard]] bool running() const;
    void park();

    [[nodiscard]] core::u32 restoreCount() const;
    [[nodiscard]] core::u32 resumeCount() const;

    /// @brief Makes the next capture / restore fail with @p reason.
    void failNextCapture(std::string reason);
    void failNextRestore(std::string reason);

    /// @brief Invoked (outside the lock) after every successful resume.
    void onResume(std::function<void()> callback);

private:
    const core::u64 _digest;

    mutable std::mutex               _mutex;
    core::Bytes                      _stack;
    std::vector<serial::GlobalValue> _globals;
    core::Bytes                      _memory;
    bool                             _running{false};
    core::u32                        _restores{0};
    core::u32                        _resumes{0};
    std::optional<std::string>       _captureFault;
    std::optional<std::string>       _restoreFault;
    std::function<void()>            _onResume;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_IN_MEMORY_HOST_HPP
