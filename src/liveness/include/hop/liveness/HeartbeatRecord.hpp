// /////////////////////////////////////////////////////////////////////////////
/// @file HeartbeatRecord.hpp
/// @brief Liveness bookkeeping for one monitored node.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hop/core/Types.hpp>
#include <hop/core/NonCopyable.hpp>

#include <atomic>
#include <chrono>
#include <string_view>

namespace hop::liveness {

// /////////////////////////////////////////////////////////////////////////////
/// @enum LivenessState
/// @brief Healthy → Suspect on the first miss, → Lost at the threshold.
///
/// Lost is terminal.
// /////////////////////////////////////////////////////////////////////////////
enum class LivenessState : core::u8
{
    Healthy,
    Suspect,
    Lost
};

[[nodiscard]] std::string_view toString(LivenessState state) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class HeartbeatRecord
/// @brief Per-target missed count, last sighting and state.
///
/// Written only by the owning monitor's timer thread; every field is an
/// atomic so other threads may read it at any time.
// /////////////////////////////////////////////////////////////////////////////
class HeartbeatRecord final : public core::NonMovable<HeartbeatRecord>
{
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /// @param target Monitored node.
    explicit HeartbeatRecord(core::NodeId target);

    [[nodiscard]] const core::NodeId& target() const noexcept { return target_; }

    /// @brief A probe succeeded: resets the missed count (unless Lost).
    void markSeen(TimePoint now = Clock::now()) noexcept;

    /// @brief A probe failed.
    /// @param threshold Misses that make the target Lost.
    /// @param minSilence Time since the first miss of the current streak
    ///        that must also have elapsed before the target is Lost.
    /// @return The state after the miss.
    LivenessState markMissed(core::u32 threshold,
                             std::chrono::milliseconds minSilence = std::chrono::milliseconds::zero(),
                             TimePoint now = Clock::now()) noexcept;

    [[nodiscard]] LivenessState state() const noexcept;
    [[nodiscard]] core::u32     missedCount() const noexcept;

    /// @brief Time of the last successful probe (construction time before).
    [[nodiscard]] TimePoint lastSeen() const noexcept;

private:
    const core::NodeId              target_;
    std::atomic<LivenessState>      state_{LivenessState::Healthy};
    std::atomic<core::u32>          missed_{0};
    std::atomic<Clock::rep>         lastSeen_;
    std::atomic<Clock::rep>         firstMissed_{0};
};

} // namespace hop::liveness
