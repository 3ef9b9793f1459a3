// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>

#include <tui/TerminalOutput.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace lode::tui
{

struct LogEntry
{
    log::Level level;
    std::string message;
};

/// @brief Collapsible list of recent log messages shown above the status bar.
///
/// addLog() may be called from any thread; everything else runs on the UI thread.
/// Collapsed, the panel is a single header row.
class LogPanel
{
  public:
    void addLog(log::Level level, std::string message);

    void toggle();
    void setExpanded(bool expanded);
    [[nodiscard]] auto isExpanded() const -> bool;

    [[nodiscard]] auto entryCount() const -> std::size_t;

    /// @brief Rows taken on screen: the header plus the visible entries when expanded.
    [[nodiscard]] auto totalHeight() const -> int;

    /// @brief Whether entries arrived since the last render().
    [[nodiscard]] auto takeDirty() -> bool { return _dirty.exchange(false); }

    void render(TerminalOutput& output, int startRow, int cols);

    /// @brief Toggles the panel when @p row is its header row.
    [[nodiscard]] auto handleClick(int row, int panelStartRow) -> bool;

    void scrollUp();
    void scrollDown();

    static constexpr int MaxEntries = 200;
    static constexpr int VisibleRows = 6;

  private:
    mutable std::mutex _mutex;
    std::deque<LogEntry> _entries;
    bool _expanded = false;
    int _scrollOffset = 0; ///< Entries skipped from the newest end.
    std::atomic<bool> _dirty = false;
};

} // namespace lode::tui
