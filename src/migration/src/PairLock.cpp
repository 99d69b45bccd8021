/**
 * @file PairLock.cpp
 * @brief PairLock implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/PairLock.hpp>

#include <utility>

namespace hop::migration {

PairLock::Guard::Guard(Guard &&other) noexcept
    : _owner(std::exchange(other._owner, nullptr)), _key(std::move(other._key))
{
}

PairLock::Guard::~Guard()
{
    if (_owner)
        _owner->release(_key);
}

std::string PairLock::keyOf(const core::NodeId &source, const core::NodeId &destination)
{
    std::string key;
    key.reserve(source.size() + destination.size() + 1);
    key.append(source).push_back('\0');
    key.append(destination);
    return key;
}

PairLock::Guard PairLock::acquire(const core::NodeId &source, const core::NodeId &destination)
{
    auto key = keyOf(source, destination);

    std::unique_lock lock{_mutex};
    auto &tickets = _pairs[key];
    const auto ticket = tickets.next++;
    _cv.wait(lock, [&tickets, ticket] { return tickets.serving == ticket; });
    return Guard{*this, std::move(key)};
}

void PairLock::release(const std::string &key)
{
    {
        std::lock_guard lock{_mutex};
        auto it = _pairs.find(key);
        if (it == _pairs.end())
            return;
        if (++it->second.serving == it->second.next)
            _pairs.erase(it);
    }
    _cv.notify_all();
}

core::u64 PairLock::queued(const core::NodeId &source, const core::NodeId &destination) const
{
    std::lock_guard lock{_mutex};
    const auto it = _pairs.find(keyOf(source, destination));
    return it == _pairs.end() ? 0 : it->second.next - it->second.serving;
}

} // namespace hop::migration
