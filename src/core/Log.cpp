// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <mutex>
#include <print>
#include <utility>

namespace lode::log
{

namespace
{
    constexpr auto LevelNames = std::array<std::string_view, 5> { "error", "warning", "info", "debug", "trace" };

    auto currentLevel = std::atomic<Level> { Level::Info };

    // Serializes sink calls as well as the stderr fallback.
    auto sinkMutex = std::mutex {};
    auto activeSink = Sink {};

    auto stderrTag(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

auto exchangeSink(Sink sink) -> Sink
{
    auto const lock = std::lock_guard(sinkMutex);
    return std::exchange(activeSink, std::move(sink));
}

void setLevel(Level level)
{
    currentLevel.store(level, std::memory_order_relaxed);
}

auto level() -> Level
{
    return currentLevel.load(std::memory_order_relaxed);
}

auto levelName(Level level) -> std::string_view
{
    auto const index = static_cast<std::size_t>(level);
    return index < LevelNames.size() ? LevelNames[index] : "unknown";
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto const equalsIgnoringCase = [name](std::string_view candidate) {
        return std::ranges::equal(name, candidate, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        });
    };
    for (auto i = std::size_t { 0 }; i < LevelNames.size(); ++i)
    {
        if (equalsIgnoringCase(LevelNames[i]))
            return static_cast<Level>(i);
    }
    if (equalsIgnoringCase("warn"))
        return Level::Warning;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto const lock = std::lock_guard(sinkMutex);
    if (activeSink)
        activeSink(level, message);
    else
        std::println(stderr, "[{}] {}", stderrTag(level), message);
}

} // namespace lode::log
