// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace onyx
{

/// @brief A unit of deferred work.
using Task = std::function<void()>;

/// @brief Abstract interface for running short-lived tasks off the calling thread.
class TaskScheduler
{
  public:
    virtual ~TaskScheduler() = default;

    /// @brief Runs a task once the given delay has elapsed.
    /// @param delay Time to wait before running the task.
    /// @param task The work to run.
    virtual void schedule(std::chrono::milliseconds delay, Task task) = 0;

    /// @brief Runs a task as soon as possible.
    void post(Task task) { schedule(std::chrono::milliseconds { 0 }, std::move(task)); }
};

/// @brief Scheduler backed by a single background worker thread.
///
/// Tasks run in deadline order, ties in submission order. A task that is still
/// pending when the scheduler shuts down is dropped without running.
class ThreadTaskScheduler: public TaskScheduler
{
  public:
    ThreadTaskScheduler();
    ~ThreadTaskScheduler() override;

    ThreadTaskScheduler(const ThreadTaskScheduler&) = delete;
    ThreadTaskScheduler& operator=(const ThreadTaskScheduler&) = delete;

    void schedule(std::chrono::milliseconds delay, Task task) override;

    /// @brief Returns the number of tasks waiting for their deadline.
    [[nodiscard]] auto pendingCount() const -> std::size_t;

    /// @brief Drops pending tasks and joins the worker thread.
    void shutdown();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace onyx
