/**
 * @file Log.cpp
 * @brief Log façade and the default stderr sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "hop/core/Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace hop::core {

namespace {

/// Wall-clock time of day, millisecond resolution, UTC.
struct TimeOfDay {
    unsigned hours;
    unsigned minutes;
    unsigned seconds;
    unsigned millis;
};

TimeOfDay now()
{
    using namespace std::chrono;
    const auto ms  = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    const auto day = ms % (24LL * 3600 * 1000);
    return TimeOfDay{
        static_cast<unsigned>(day / 3'600'000),
        static_cast<unsigned>(day / 60'000 % 60),
        static_cast<unsigned>(day / 1'000 % 60),
        static_cast<unsigned>(day % 1'000)
    };
}

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const auto level_name = toString(level);
        const auto t = now();

        std::lock_guard lock{_mutex};
        std::fprintf(
            stderr,
            "[%02u:%02u:%02u.%03u][%.*s][%.*s] %.*s\n",
            t.hours, t.minutes, t.seconds, t.millis,
            static_cast<int>(level_name.size()), level_name.data(),
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }

private:
    std::mutex _mutex;
};

StderrLogger           gStderr;
std::atomic<ILogger *> gSink{&gStderr};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!Log::enabled(level))
        return;
    gSink.load(std::memory_order_acquire)->write(level, tag, msg);
}

} // anonymous namespace

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO ";
    case LogLevel::kWarn:  return "WARN ";
    case LogLevel::kError: return "ERROR";
    case LogLevel::kFatal: return "FATAL";
    }
    return "?????";
}

ILogger *Log::setLogger(ILogger *logger)
{
    ILogger *previous = gSink.exchange(logger ? logger : &gStderr, std::memory_order_acq_rel);
    return previous == &gStderr ? nullptr : previous;
}

void Log::setMinLevel(LogLevel level) { gMinLevel.store(level, std::memory_order_relaxed); }
LogLevel Log::minLevel()              { return gMinLevel.load(std::memory_order_relaxed); }
bool Log::enabled(LogLevel level)     { return level >= minLevel(); }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace hop::core
