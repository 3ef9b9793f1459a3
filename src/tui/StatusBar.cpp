// SPDX-License-Identifier: Apache-2.0
#include <tui/StatusBar.hpp>
#include <tui/TextWrap.hpp>

#include <algorithm>
#include <format>

namespace lode::tui
{

namespace
{
    constexpr auto Background = Style { .fg = 252, .bg = 236 };
    constexpr auto PhaseStyle = Style { .fg = 117, .bg = 236, .bold = true };
    constexpr auto KeyStyle = Style { .fg = 111, .bg = 236, .bold = true };
} // namespace

auto StatusBar::leftText() const -> std::string
{
    auto text = std::format("[{}]", _phase);
    if (!_busyFrame.empty())
        text += std::format(" {}", _busyFrame);
    if (!_status.empty())
        text += std::format(" {}", _status);
    return text;
}

void StatusBar::render(TerminalOutput& output, int row, int width) const
{
    output.moveTo(row, 1);
    output.writePadded({}, width, Background);

    auto const left = truncate(leftText(), width - 2);
    output.moveTo(row, 2);
    auto const phaseLabel = std::format("[{}]", _phase);
    if (left.starts_with(phaseLabel))
    {
        output.write(phaseLabel, PhaseStyle);
        output.write(std::string_view(left).substr(phaseLabel.size()), Background);
    }
    else
        output.write(left, Background);

    // Hints, right-aligned, as many as fit after the left text.
    auto hints = std::vector<KeyHint> {};
    auto hintsWidth = 0;
    auto const available = width - displayWidth(left) - 4;
    for (auto const& hint: _hints)
    {
        auto const w = displayWidth(hint.key) + 1 + displayWidth(hint.action) + (hints.empty() ? 0 : 2);
        if (hintsWidth + w > available)
            break;
        hints.push_back(hint);
        hintsWidth += w;
    }
    if (hints.empty())
        return;

    output.moveTo(row, width - hintsWidth);
    for (auto i = std::size_t { 0 }; i < hints.size(); ++i)
    {
        if (i > 0)
            output.write("  ", Background);
        output.write(hints[i].key, KeyStyle);
        output.write(" " + hints[i].action, Background);
    }
}

} // namespace lode::tui
