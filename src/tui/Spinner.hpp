// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace lode::tui
{

/// @brief Braille-dot busy indicator. Advance with tick() from the render loop.
class Spinner
{
  public:
    using Clock = std::chrono::steady_clock;

    static constexpr auto Frames = std::array<std::string_view, 10> {
        "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏",
    };
    static constexpr auto Interval = std::chrono::milliseconds(80);

    /// @brief Moves to the next frame once the interval has elapsed.
    /// @return True if the frame changed.
    auto tick(Clock::time_point now = Clock::now()) -> bool;

    [[nodiscard]] auto currentFrame() const noexcept -> std::string_view { return Frames[_frame]; }
    [[nodiscard]] auto frameIndex() const noexcept -> std::size_t { return _frame; }

    void reset();

  private:
    std::size_t _frame = 0;
    Clock::time_point _lastTick {};
};

} // namespace lode::tui
