// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.cpp
/// @brief Implementation of the fixed-size thread pool.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/concurrency/ThreadPool.hpp>
#include <hop/core/Log.hpp>

#include <algorithm>
#include <exception>
#include <format>

namespace hop::concurrency {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

ThreadPool::ThreadPool(core::u32 threadCount)
{
    const core::u32 count = (threadCount == 0)
        ? std::max(1u, std::thread::hardware_concurrency())
        : threadCount;

    workers_.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
    {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

// -------------------------------------------------------------------------- //
//  Submission                                                                //
// -------------------------------------------------------------------------- //

bool ThreadPool::submit(Task task)
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopping_.load(std::memory_order_relaxed))
        {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopping_.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }
    }

    cv_.notify_all();

    for (auto& worker : workers_)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

core::u32 ThreadPool::threadCount() const noexcept
{
    return static_cast<core::u32>(workers_.size());
}

core::usize ThreadPool::pending() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return tasks_.size();
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

void ThreadPool::workerLoop()
{
    for (;;)
    {
        Task task;

        {
            std::unique_lock<std::mutex> lock{mutex_};
            cv_.wait(lock, [this] {
                return stopping_.load(std::memory_order_relaxed) || !tasks_.empty();
            });

            if (tasks_.empty())
            {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            core::Log::error("pool", std::format("worker task threw: {}", e.what()));
        }
    }
}

} // namespace hop::concurrency
