// SPDX-License-Identifier: Apache-2.0
#include "GtkMainThread.hpp"

#include <glib.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

namespace onyx::platform
{

namespace
{
    auto mainThreadId = std::thread::id {};
    auto mainLoopAlive = std::atomic<bool> { false };

    auto runQueued(gpointer data) -> gboolean
    {
        auto* fn = static_cast<std::function<void()>*>(data);
        (*fn)();
        return G_SOURCE_REMOVE;
    }

    void deleteQueued(gpointer data)
    {
        delete static_cast<std::function<void()>*>(data);
    }
} // namespace

void markMainThread()
{
    mainThreadId = std::this_thread::get_id();
    mainLoopAlive.store(true);
}

void markMainLoopFinished()
{
    mainLoopAlive.store(false);
}

auto isMainThread() -> bool
{
    return std::this_thread::get_id() == mainThreadId;
}

void invokeOnMainThread(std::function<void()> fn)
{
    if (isMainThread())
    {
        fn();
        return;
    }

    g_main_context_invoke_full(
        nullptr, G_PRIORITY_DEFAULT, runQueued, new std::function<void()>(std::move(fn)), deleteQueued);
}

auto invokeOnMainThreadAndWait(const std::function<void()>& fn) -> bool
{
    if (isMainThread())
    {
        fn();
        return true;
    }

    // The queued task may outlive this call if the main loop stops first.
    auto task = std::make_shared<std::packaged_task<void()>>(fn);
    auto finished = task->get_future();
    invokeOnMainThread([task] { (*task)(); });

    while (finished.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready)
    {
        if (!mainLoopAlive.load())
            return false;
    }
    return true;
}

} // namespace onyx::platform
