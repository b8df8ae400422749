// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace onyx::log
{

/// @brief Verbosity levels, most severe first.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter, without prefix.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Replaces the default stderr sink. An empty sink restores stderr.
///
/// The sink runs with the log lock held and must not log itself.
void setSink(Sink sink);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Lower-case name of a level, as accepted by levelFromString().
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses "error", "warning" (or "warn"), "info", "debug" or "trace".
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Emits a message from any thread.
///
/// The default sink prints `HH:MM:SS.mmm LEVEL [thread] message` to stderr,
/// the thread tag telling the GUI, shortcut and scheduler threads apart.
void write(Level level, std::string_view message);

/// @brief Installs a sink for the lifetime of the object and restores the previous one afterwards.
class ScopedSink
{
  public:
    explicit ScopedSink(Sink sink);
    ~ScopedSink();

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

  private:
    Sink _previous;
};

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Formatting is skipped entirely below Debug verbosity.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace onyx::log
