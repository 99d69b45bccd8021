// /////////////////////////////////////////////////////////////////////////////
/// @file HeartbeatMonitor.cpp
/// @brief HeartbeatMonitor implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/liveness/HeartbeatMonitor.hpp>
#include <hop/core/Log.hpp>

#include <format>

namespace hop::liveness {

HeartbeatMonitor::HeartbeatMonitor(core::NodeId target,
                                   std::chrono::milliseconds interval,
                                   core::u32 threshold,
                                   Probe probe,
                                   LostAction onLost,
                                   bool armed,
                                   std::chrono::milliseconds minLostDuration)
    : record_{std::move(target)}
    , interval_{interval}
    , threshold_{threshold}
    , minLostDuration_{minLostDuration}
    , probe_{std::move(probe)}
    , onLost_{std::move(onLost)}
    , armed_{armed}
{}

HeartbeatMonitor::~HeartbeatMonitor()
{
    stop();
}

void HeartbeatMonitor::start()
{
    std::lock_guard lock{mutex_};
    if (thread_.joinable() || stopping_)
        return;
    thread_ = std::thread{[this] { run(); }};
}

void HeartbeatMonitor::stop()
{
    {
        std::lock_guard lock{mutex_};
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

void HeartbeatMonitor::arm() noexcept
{
    armed_.store(true, std::memory_order_release);
}

void HeartbeatMonitor::run()
{
    for (;;)
    {
        {
            std::unique_lock lock{mutex_};
            if (cv_.wait_for(lock, interval_, [this] { return stopping_; }))
                return;
        }

        if (!armed())
            continue;

        if (probe_())
        {
            record_.markSeen();
            continue;
        }

        const auto state = record_.markMissed(threshold_, minLostDuration_);
        if (state == LivenessState::Suspect)
        {
            if (core::Log::enabled(core::LogLevel::kDebug))
                core::Log::debug("liveness", std::format("{} missed {} heartbeat(s)", record_.target(),
                                                         record_.missedCount()));
            continue;
        }

        core::Log::error("liveness", std::format("{} lost after {} missed heartbeats", record_.target(),
                                                 record_.missedCount()));
        if (onLost_)
            onLost_(record_.target());
        return;
    }
}

} // namespace hop::liveness
