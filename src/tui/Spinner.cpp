// SPDX-License-Identifier: Apache-2.0
#include <tui/Spinner.hpp>

namespace lode::tui
{

auto Spinner::tick(Clock::time_point now) -> bool
{
    if (now - _lastTick < Interval)
        return false;
    _lastTick = now;
    _frame = (_frame + 1) % Frames.size();
    return true;
}

void Spinner::reset()
{
    _frame = 0;
    _lastTick = {};
}

} // namespace lode::tui
