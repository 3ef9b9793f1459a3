// SPDX-License-Identifier: Apache-2.0
#include <tui/TerminalOutput.hpp>
#include <tui/TextWrap.hpp>

#include <cerrno>
#include <format>

#include <sys/ioctl.h>
#include <unistd.h>

namespace lode::tui
{

namespace
{
    constexpr auto ResetAttributes = std::string_view { "\033[m" };

    // Best effort: a terminal that went away mid-frame is not worth an error path.
    void writeAll(int fd, std::string_view data)
    {
        if (fd < 0)
            return;
        while (!data.empty())
        {
            auto const n = ::write(fd, data.data(), data.size());
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return;
            data.remove_prefix(static_cast<std::size_t>(n));
        }
    }

    auto privateMode(int mode, bool enabled) -> std::string
    {
        return std::format("\033[?{}{}", mode, enabled ? 'h' : 'l');
    }
} // namespace

auto sgrSequence(Style const& style) -> std::string
{
    if (style.isPlain())
        return {};

    auto params = std::string {};
    auto const add = [&params](std::string_view param) {
        if (!params.empty())
            params += ';';
        params += param;
    };

    if (style.bold)
        add("1");
    if (style.dim)
        add("2");
    if (style.italic)
        add("3");
    if (style.inverse)
        add("7");
    if (style.fg)
        add(std::format("38;5;{}", *style.fg));
    if (style.bg)
        add(std::format("48;5;{}", *style.bg));

    return std::format("\033[{}m", params);
}

SyncGuard::SyncGuard(int fd): _fd(fd)
{
    writeAll(_fd, privateMode(2026, true));
}

SyncGuard::~SyncGuard()
{
    writeAll(_fd, privateMode(2026, false));
}

TerminalOutput::TerminalOutput(int fd): _fd(fd)
{
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    if (style.isPlain())
    {
        _buffer.append(text);
        return;
    }
    _buffer += sgrSequence(style);
    _buffer.append(text);
    _buffer += ResetAttributes;
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::writePadded(std::string_view text, int width, Style const& style)
{
    auto line = std::string(text);
    if (auto const used = displayWidth(text); used < width)
        line.append(static_cast<std::size_t>(width - used), ' ');
    write(line, style);
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearLine()
{
    _buffer += "\033[2K";
}

void TerminalOutput::clearScreen()
{
    _buffer += "\033[2J\033[H";
}

void TerminalOutput::setAltScreen(bool enabled)
{
    _buffer += privateMode(1049, enabled);
}

void TerminalOutput::setCursorVisible(bool visible)
{
    _buffer += privateMode(25, visible);
}

auto TerminalOutput::syncGuard() -> SyncGuard
{
    flush();
    return SyncGuard(_fd);
}

void TerminalOutput::flush()
{
    if (_fd < 0)
        return;
    writeAll(_fd, _buffer);
    _buffer.clear();
}

void TerminalOutput::updateDimensions()
{
    auto size = winsize {};
    if (_fd >= 0 && ioctl(_fd, TIOCGWINSZ, &size) == 0 && size.ws_col > 0 && size.ws_row > 0)
    {
        _cols = size.ws_col;
        _rows = size.ws_row;
    }
}

} // namespace lode::tui
