// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>

namespace onyx::platform
{

/// @brief Remembers the calling thread as the GTK main thread. Call right after gtk_init.
void markMainThread();

/// @brief Stops accepting blocking calls from other threads once the main loop has exited.
void markMainLoopFinished();

/// @brief Returns true when called on the thread passed to markMainThread().
[[nodiscard]] auto isMainThread() -> bool;

/// @brief Queues a function on the GTK main loop, or runs it right away when already on the main thread.
void invokeOnMainThread(std::function<void()> fn);

/// @brief Runs a function on the GTK main thread and blocks until it has finished.
///
/// Must not be called from a thread the main loop itself waits on.
/// @return false if the main loop finished before the function could run.
[[nodiscard]] auto invokeOnMainThreadAndWait(const std::function<void()>& fn) -> bool;

} // namespace onyx::platform
