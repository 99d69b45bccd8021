// /////////////////////////////////////////////////////////////////////////////
/// @file ThreadPool.hpp
/// @brief Fixed-size worker pool serving inbound peer connections.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <hop/core/Types.hpp>
#include <hop/core/NonCopyable.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace hop::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class ThreadPool
/// @brief Simple fixed-thread-count pool.
///
/// Workers pull tasks from a shared FIFO queue protected by a mutex +
/// condition variable.  A node can be the source of one migration and the
/// destination of another at the same time, so inbound requests are served
/// here rather than on the accept thread.
///
/// @ref shutdown stops accepting work, drains the queue and joins the
/// workers; the destructor calls it implicitly.
// /////////////////////////////////////////////////////////////////////////////
class ThreadPool final : public core::NonMovable<ThreadPool>
{
public:
    using Task = std::function<void()>;

    /// @brief Creates the pool with @p threadCount worker threads.
    /// @param threadCount Number of worker threads.  Zero means
    ///        @c std::thread::hardware_concurrency().
    explicit ThreadPool(core::u32 threadCount = 0);

    /// @brief Drains pending tasks and joins all workers.
    ~ThreadPool();

    /// @brief Queues a fire-and-forget task.
    /// @return false once @ref shutdown has begun; the task is dropped.
    [[nodiscard]] bool submit(Task task);

    /// @brief Signals workers to finish and blocks until all queued tasks
    ///        are processed.
    void shutdown();

    /// @brief Returns the number of worker threads.
    [[nodiscard]] core::u32 threadCount() const noexcept;

    /// @brief Returns the number of queued, not yet started tasks.
    [[nodiscard]] core::usize pending() const;

private:
    /// @brief Worker loop: waits on the CV and processes tasks.
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<Task>         tasks_;
    mutable std::mutex       mutex_;
    std::condition_variable  cv_;
    std::atomic<bool>        stopping_{false};
};

} // namespace hop::concurrency
