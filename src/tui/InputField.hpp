// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/InputEvent.hpp>

namespace lode::tui
{

/// @brief Result of feeding an input event to an InputField.
enum class InputFieldAction : std::uint8_t
{
    Changed, ///< Text or cursor changed.
    Submit,  ///< Enter.
    Abort,   ///< Ctrl+C.
    Eof,     ///< Ctrl+D on an empty line.
    None,    ///< Not an editing key.
};

/// @brief The part of the line that fits into the input box.
struct InputView
{
    std::string_view text;
    int cursorColumn = 0; ///< 0-based column of the cursor within @c text.
};

/// @brief Single-line editor model with Emacs-style keys and a submit history.
///
/// Cursor movement and deletion work on grapheme clusters (libunicode).
/// Up and Down are left to the caller; history is on Ctrl+P and Ctrl+N.
class InputField
{
  public:
    [[nodiscard]] auto processEvent(InputEvent const& event) -> InputFieldAction;

    [[nodiscard]] auto text() const noexcept -> std::string_view { return _buffer; }

    /// @brief Cursor as a byte offset into text().
    [[nodiscard]] auto cursor() const noexcept -> std::size_t { return _cursor; }

    void clear();
    void setText(std::string_view text);

    /// @brief Remembers a submitted line; empty lines and repeats are skipped.
    void addHistory(std::string entry);

    /// @brief Returns the window of text to show in @p width columns, scrolled to keep the cursor visible.
    [[nodiscard]] auto view(int width) -> InputView;

    static constexpr std::size_t MaxHistory = 100;

  private:
    [[nodiscard]] auto handleKey(KeyEvent const& key) -> InputFieldAction;

    void insert(std::string_view text);
    void deleteForward();
    void deleteBackward();
    void killToEnd();
    void killToStart();
    void killWordBackward();
    void historyPrev();
    void historyNext();

    [[nodiscard]] auto nextBoundary(std::size_t pos) const -> std::size_t;
    [[nodiscard]] auto prevBoundary(std::size_t pos) const -> std::size_t;
    [[nodiscard]] auto boundaries() const -> std::vector<std::size_t>;

    std::string _buffer;
    std::size_t _cursor = 0;
    int _scroll = 0; ///< First visible grapheme.

    std::vector<std::string> _history;
    std::size_t _historyIndex = 0;
    std::string _draft;
};

} // namespace lode::tui
