// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace lode::tui
{

/// @brief A keyboard shortcut shown on the right of the status bar.
struct KeyHint
{
    std::string key;
    std::string action;
};

/// @brief Bottom status row: "[phase] <spinner> status" on the left, key hints on the right.
///
/// Hints are dropped from the right when the row is too narrow.
class StatusBar
{
  public:
    void setPhase(std::string phase) { _phase = std::move(phase); }
    void setStatus(std::string status) { _status = std::move(status); }
    void setHints(std::vector<KeyHint> hints) { _hints = std::move(hints); }

    /// @brief Shows @p frame before the status text; an empty frame hides the indicator.
    void setBusyFrame(std::string_view frame) { _busyFrame = std::string(frame); }

    void render(TerminalOutput& output, int row, int width) const;

    /// @brief The left-hand text as rendered, without styling.
    [[nodiscard]] auto leftText() const -> std::string;

  private:
    std::string _phase;
    std::string _status;
    std::string _busyFrame;
    std::vector<KeyHint> _hints;
};

} // namespace lode::tui
