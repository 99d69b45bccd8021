/**
 * @file CallChain.hpp
 * @brief Call/return bookkeeping for functions placed on other nodes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_MIGRATION_CALL_CHAIN_HPP
    #define HOP_MIGRATION_CALL_CHAIN_HPP

#include <hop/serial/ExecutionSnapshot.hpp>

#include <optional>
#include <vector>

namespace hop::migration {

/**
 * @brief Stack of @c {fromNode, stackHeight} frames travelling with the
 *        execution.
 *
 * Entering a function placed on another node pushes the caller's node
 * and stack height.  Leaving a function at the height recorded on top
 * pops that frame and names the node to return to.
 */
class CallChain
{
public:
    CallChain() = default;
    explicit CallChain(std::vector<serial::CallFrame> frames) : _frames(std::move(frames)) {}

    /**
     * @brief Function entry.
     * @return true when @p target differs from @p current and a frame was
     *         pushed; the caller must then migrate to @p target.
     */
    bool enter(const core::NodeId &current, const core::NodeId &target, core::u32 stackHeight);

    /**
     * @brief Function exit.
     * @return The node to migrate back to, or nothing when this exit does
     *         not close a remote call (or would return to @p current).
     */
    std::optional<core::NodeId> exit(const core::NodeId &current, core::u32 stackHeight);

    /// @brief Undoes the last @ref enter after a failed migration.
    void abandonLast();

    [[nodiscard]] const std::vector<serial::CallFrame> &frames() const noexcept { return _frames; }
    [[nodiscard]] core::usize depth() const noexcept { return _frames.size(); }
    [[nodiscard]] bool empty() const noexcept { return _frames.empty(); }

    void replace(std::vector<serial::CallFrame> frames) { _frames = std::move(frames); }
    void clear() noexcept { _frames.clear(); }

private:
    std::vector<serial::CallFrame> _frames;
};

} // namespace hop::migration

#endif // HOP_MIGRATION_CALL_CHAIN_HPP
