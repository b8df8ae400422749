// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <print>
#include <thread>
#include <utility>

namespace onyx::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalSink = Sink {};
    auto sinkMutex = std::mutex {};

    /// Short, stable tag for the calling thread.
    auto threadTag() -> std::size_t
    {
        return std::hash<std::thread::id> {}(std::this_thread::get_id()) % 10000;
    }

    void printToStderr(Level level, std::string_view message)
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        auto const timeOfDay = std::chrono::hh_mm_ss(now - std::chrono::floor<std::chrono::days>(now));
        std::println(stderr, "{:%T} {:<7} [{:04}] {}", timeOfDay, levelName(level), threadTag(), message);
    }
} // namespace

void setSink(Sink sink)
{
    auto const lock = std::lock_guard(sinkMutex);
    globalSink = std::move(sink);
}

void setLevel(Level level)
{
    globalLevel.store(level);
}

auto getLevel() -> Level
{
    return globalLevel.load();
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "unknown";
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "warn")
        return Level::Warning;
    for (auto const level: { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace })
        if (levelName(level) == name)
            return level;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel.load())
        return;

    auto const lock = std::lock_guard(sinkMutex);
    if (globalSink)
        globalSink(level, message);
    else
        printToStderr(level, message);
}

ScopedSink::ScopedSink(Sink sink)
{
    auto const lock = std::lock_guard(sinkMutex);
    _previous = std::exchange(globalSink, std::move(sink));
}

ScopedSink::~ScopedSink()
{
    setSink(std::move(_previous));
}

} // namespace onyx::log
