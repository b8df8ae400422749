// SPDX-License-Identifier: Apache-2.0
#include "TaskScheduler.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace onyx
{

namespace
{

    using Clock = std::chrono::steady_clock;

    struct ScheduledTask
    {
        Clock::time_point deadline;
        std::uint64_t sequence = 0;
        Task task;
    };

    /// @brief Orders the priority queue so that the earliest deadline is on top.
    struct LaterFirst
    {
        auto operator()(const ScheduledTask& a, const ScheduledTask& b) const -> bool
        {
            if (a.deadline != b.deadline)
                return a.deadline > b.deadline;
            return a.sequence > b.sequence;
        }
    };

} // namespace

struct ThreadTaskScheduler::Impl
{
    std::jthread worker;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>, LaterFirst> queue;
    std::uint64_t nextSequence = 0;
    bool shutdownRequested = false;

    /// @brief Worker thread function that runs tasks as their deadlines pass.
    /// @param stopToken The stop token for cooperative cancellation.
    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto task = Task {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return !queue.empty() || shutdownRequested; });

                if (stopToken.stop_requested() || shutdownRequested)
                    return;

                auto const deadline = queue.top().deadline;
                if (Clock::now() < deadline)
                {
                    // Woken early either by timeout or by a task with an earlier deadline.
                    cv.wait_until(lock, stopToken, deadline, [this, deadline] {
                        return shutdownRequested || queue.top().deadline < deadline;
                    });
                    continue;
                }

                task = std::move(const_cast<ScheduledTask&>(queue.top()).task);
                queue.pop();
            }

            if (task)
                task();
        }
    }
};

ThreadTaskScheduler::ThreadTaskScheduler(): _impl(std::make_unique<Impl>())
{
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

ThreadTaskScheduler::~ThreadTaskScheduler()
{
    shutdown();
}

void ThreadTaskScheduler::schedule(std::chrono::milliseconds delay, Task task)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->queue.push(ScheduledTask {
            .deadline = Clock::now() + delay,
            .sequence = _impl->nextSequence++,
            .task = std::move(task),
        });
    }
    _impl->cv.notify_one();
}

auto ThreadTaskScheduler::pendingCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.size();
}

void ThreadTaskScheduler::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->shutdownRequested = true;
        _impl->queue = {};
    }

    _impl->cv.notify_all();

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        if (_impl->worker.get_id() != std::this_thread::get_id())
            _impl->worker.join();
    }
}

} // namespace onyx
