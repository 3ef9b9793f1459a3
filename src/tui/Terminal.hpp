// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <tui/InputEvent.hpp>
#include <tui/TerminalOutput.hpp>
#include <tui/VtParser.hpp>

#include <vector>

#include <termios.h>

namespace lode::tui
{

/// @brief Owns the controlling terminal for the lifetime of the full-screen UI.
///
/// initialize() switches stdin to raw mode, enables bracketed paste, SGR mouse
/// and the kitty keyboard protocol, and routes SIGWINCH through a self-pipe so
/// poll() reports resizes as events. shutdown() (also run by the destructor)
/// restores everything. Only one Terminal may be initialized at a time.
class Terminal
{
  public:
    Terminal();
    ~Terminal();

    Terminal(Terminal const&) = delete;
    auto operator=(Terminal const&) -> Terminal& = delete;
    Terminal(Terminal&&) = delete;
    auto operator=(Terminal&&) -> Terminal& = delete;

    /// @return An IoError if stdin is not a terminal or its mode cannot be changed.
    [[nodiscard]] auto initialize() -> VoidResult;

    void shutdown();

    [[nodiscard]] auto output() noexcept -> TerminalOutput& { return _output; }

    /// @brief Waits up to @p timeoutMs for input and returns the decoded events.
    [[nodiscard]] auto poll(int timeoutMs) -> std::vector<InputEvent>;

  private:
    void writeControl(std::string_view sequence);

    TerminalOutput _output;
    VtParser _parser;
    struct termios _savedMode {};
    int _wakePipe[2] = { -1, -1 };
    bool _initialized = false;
};

} // namespace lode::tui
