// /////////////////////////////////////////////////////////////////////////////
/// @file HeartbeatMonitor.hpp
/// @brief Timer-driven liveness monitor for one target.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hop/liveness/HeartbeatRecord.hpp>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace hop::liveness {

// /////////////////////////////////////////////////////////////////////////////
/// @class HeartbeatMonitor
/// @brief Probes a target every @c interval on its own thread.
///
/// A failed probe increments the missed count, a successful one resets it.
/// When the count reaches @c threshold, and the misses have lasted at
/// least @c minLostDuration, the target becomes Lost, the lost action runs
/// exactly once on the monitor thread, and probing stops.
///
/// A monitor created disarmed ticks without probing until @ref arm.
// /////////////////////////////////////////////////////////////////////////////
class HeartbeatMonitor final : public core::NonMovable<HeartbeatMonitor>
{
public:
    /// @brief Returns true when the target proved alive during this tick.
    using Probe      = std::function<bool()>;
    using LostAction = std::function<void(const core::NodeId&)>;

    HeartbeatMonitor(core::NodeId target,
                     std::chrono::milliseconds interval,
                     core::u32 threshold,
                     Probe probe,
                     LostAction onLost,
                     bool armed = true,
                     std::chrono::milliseconds minLostDuration = std::chrono::milliseconds::zero());

    /// @brief Stops and joins the timer thread.
    ~HeartbeatMonitor();

    /// @brief Launches the timer thread (idempotent).
    void start();

    /// @brief Stops probing and joins the timer thread.
    void stop();

    /// @brief Enables probing on the next tick.
    void arm() noexcept;

    [[nodiscard]] bool armed() const noexcept { return armed_.load(std::memory_order_acquire); }
    [[nodiscard]] const HeartbeatRecord& record() const noexcept { return record_; }
    [[nodiscard]] LivenessState state() const noexcept { return record_.state(); }

private:
    void run();

    HeartbeatRecord           record_;
    std::chrono::milliseconds interval_;
    core::u32                 threshold_;
    std::chrono::milliseconds minLostDuration_;
    Probe                     probe_;
    LostAction                onLost_;

    std::atomic<bool>       armed_;
    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    stopping_{false};
    std::thread             thread_;
};

} // namespace hop::liveness
