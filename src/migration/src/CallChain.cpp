/**
 * @file CallChain.cpp
 * @brief CallChain implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/CallChain.hpp>

namespace hop::migration {

bool CallChain::enter(const core::NodeId &current, const core::NodeId &target, core::u32 stackHeight)
{
    if (current == target)
        return false;
    _frames.push_back(serial::CallFrame{current, stackHeight});
    return true;
}

std::optional<core::NodeId> CallChain::exit(const core::NodeId &current, core::u32 stackHeight)
{
    if (_frames.empty() || _frames.back().stackHeight != stackHeight)
        return std::nullopt;

    auto from = std::move(_frames.back().fromNode);
    _frames.pop_back();
    if (from == current)
        return std::nullopt;
    return from;
}

void CallChain::abandonLast()
{
    if (!_frames.empty())
        _frames.pop_back();
}

} // namespace hop::migration
