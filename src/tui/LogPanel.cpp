// SPDX-License-Identifier: Apache-2.0
#include <tui/LogPanel.hpp>
#include <tui/TextWrap.hpp>

#include <algorithm>
#include <format>

namespace lode::tui
{

namespace
{
    auto levelTag(log::Level level) -> std::string_view
    {
        switch (level)
        {
            case log::Level::Error: return "error";
            case log::Level::Warning: return "warn ";
            case log::Level::Info: return "info ";
            case log::Level::Debug: return "debug";
            case log::Level::Trace: return "trace";
        }
        return "";
    }

    auto levelStyle(log::Level level) -> Style
    {
        auto style = Style { .bold = true };
        switch (level)
        {
            case log::Level::Error: style.fg = 1; break;
            case log::Level::Warning: style.fg = 3; break;
            case log::Level::Info: style.fg = 4; break;
            default: style.fg = 8; break;
        }
        return style;
    }

    auto repeat(std::string_view piece, int count) -> std::string
    {
        auto out = std::string {};
        for (auto i = 0; i < count; ++i)
            out += piece;
        return out;
    }
} // namespace

void LogPanel::addLog(log::Level level, std::string message)
{
    {
        auto const lock = std::lock_guard(_mutex);
        _entries.push_back(LogEntry { .level = level, .message = std::move(message) });
        if (static_cast<int>(_entries.size()) > MaxEntries)
            _entries.pop_front();
        _scrollOffset = 0;
    }
    _dirty = true;
}

void LogPanel::toggle()
{
    auto const lock = std::lock_guard(_mutex);
    _expanded = !_expanded;
    _scrollOffset = 0;
}

void LogPanel::setExpanded(bool expanded)
{
    auto const lock = std::lock_guard(_mutex);
    _expanded = expanded;
    _scrollOffset = 0;
}

auto LogPanel::isExpanded() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _expanded;
}

auto LogPanel::entryCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _entries.size();
}

auto LogPanel::totalHeight() const -> int
{
    auto const lock = std::lock_guard(_mutex);
    if (!_expanded)
        return 1;
    return 1 + VisibleRows;
}

void LogPanel::render(TerminalOutput& output, int startRow, int cols)
{
    auto const lock = std::lock_guard(_mutex);
    auto const count = static_cast<int>(_entries.size());
    auto const gray = Style { .fg = 8 };

    // ── ▶ Logs (N) ──────
    auto const header = std::format("{} Logs ({})", _expanded ? "▼" : "▶", count);
    output.moveTo(startRow, 1);
    output.clearLine();
    output.write("── ", gray);
    output.write(header, Style { .fg = 8, .bold = true });
    output.write(" " + repeat("─", std::max(0, cols - 4 - displayWidth(header))), gray);

    if (!_expanded)
        return;

    auto const maxOffset = std::max(0, count - VisibleRows);
    _scrollOffset = std::clamp(_scrollOffset, 0, maxOffset);
    auto const end = count - _scrollOffset;
    auto const begin = std::max(0, end - VisibleRows);

    for (auto row = 0; row < VisibleRows; ++row)
    {
        output.moveTo(startRow + 1 + row, 1);
        output.clearLine();
        auto const index = begin + row;
        if (index >= end)
            continue;

        auto const& entry = _entries[static_cast<std::size_t>(index)];
        output.write(std::format(" {} ", levelTag(entry.level)), levelStyle(entry.level));
        output.writeRaw(truncate(entry.message, std::max(0, cols - 8)));
    }

    if (maxOffset > 0)
    {
        auto const indicator = std::format(" [{}-{}/{}]", begin + 1, end, count);
        output.moveTo(startRow + VisibleRows, std::max(1, cols - static_cast<int>(indicator.size())));
        output.write(indicator, Style { .fg = 8, .dim = true });
    }
}

auto LogPanel::handleClick(int row, int panelStartRow) -> bool
{
    if (row != panelStartRow)
        return false;
    toggle();
    return true;
}

void LogPanel::scrollUp()
{
    auto const lock = std::lock_guard(_mutex);
    auto const maxOffset = std::max(0, static_cast<int>(_entries.size()) - VisibleRows);
    _scrollOffset = std::min(_scrollOffset + 1, maxOffset);
}

void LogPanel::scrollDown()
{
    auto const lock = std::lock_guard(_mutex);
    _scrollOffset = std::max(0, _scrollOffset - 1);
}

} // namespace lode::tui
