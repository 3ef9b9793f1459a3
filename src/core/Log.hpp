// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace lode::log
{

/// @brief Severity of a log message, most severe first.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// Receives every message that passes the level filter, without the level prefix.
/// Called from the reader, forwarder and render threads alike.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Replaces the active sink; an empty sink restores the stderr writer.
/// @return The sink that was active before.
auto exchangeSink(Sink sink) -> Sink;

/// @brief Installs a sink for the lifetime of the object.
///
/// The previously active sink (or stderr) is put back on destruction, so
/// front ends and tests can redirect diagnostics without leaking the
/// redirection past their own scope.
class ScopedSink
{
  public:
    explicit ScopedSink(Sink sink): _previous(exchangeSink(std::move(sink))) {}
    ~ScopedSink() { exchangeSink(std::move(_previous)); }

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

  private:
    Sink _previous;
};

void setLevel(Level level);
[[nodiscard]] auto level() -> Level;

[[nodiscard]] inline auto enabled(Level messageLevel) -> bool
{
    return messageLevel <= level();
}

/// @brief Lower-case name of @p level ("error", "warning", ...).
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name as printed by levelName(), ignoring case.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Delivers @p message to the active sink, or to stderr as "[LEVEL] message".
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Warning))
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// Formatting is skipped entirely unless debug output is enabled.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace lode::log
