// /////////////////////////////////////////////////////////////////////////////
/// @file HeartbeatRecord.cpp
/// @brief HeartbeatRecord implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/liveness/HeartbeatRecord.hpp>
#include <hop/core/Assert.hpp>

#include <utility>

namespace hop::liveness {

std::string_view toString(LivenessState state) noexcept
{
    switch (state)
    {
    case LivenessState::Healthy: return "Healthy";
    case LivenessState::Suspect: return "Suspect";
    case LivenessState::Lost:    return "Lost";
    }
    HOP_UNREACHABLE();
}

HeartbeatRecord::HeartbeatRecord(core::NodeId target)
    : target_{std::move(target)}
    , lastSeen_{Clock::now().time_since_epoch().count()}
{}

void HeartbeatRecord::markSeen(TimePoint now) noexcept
{
    if (state_.load(std::memory_order_acquire) == LivenessState::Lost)
        return;

    lastSeen_.store(now.time_since_epoch().count(), std::memory_order_release);
    missed_.store(0, std::memory_order_release);
    state_.store(LivenessState::Healthy, std::memory_order_release);
}

LivenessState HeartbeatRecord::markMissed(core::u32 threshold, std::chrono::milliseconds minSilence,
                                          TimePoint now) noexcept
{
    if (state_.load(std::memory_order_acquire) == LivenessState::Lost)
        return LivenessState::Lost;

    const auto missed = missed_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (missed == 1)
        firstMissed_.store(now.time_since_epoch().count(), std::memory_order_release);

    const TimePoint streakStart{Clock::duration{firstMissed_.load(std::memory_order_acquire)}};
    const bool longEnough = now - streakStart >= minSilence;
    const auto next = missed >= threshold && longEnough ? LivenessState::Lost : LivenessState::Suspect;
    state_.store(next, std::memory_order_release);
    return next;
}

LivenessState HeartbeatRecord::state() const noexcept
{
    return state_.load(std::memory_order_acquire);
}

core::u32 HeartbeatRecord::missedCount() const noexcept
{
    return missed_.load(std::memory_order_acquire);
}

HeartbeatRecord::TimePoint HeartbeatRecord::lastSeen() const noexcept
{
    return TimePoint{Clock::duration{lastSeen_.load(std::memory_order_acquire)}};
}

} // namespace hop::liveness
