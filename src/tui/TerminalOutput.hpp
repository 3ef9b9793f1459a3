// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lode::tui
{

/// @brief SGR attributes for a run of text. Colors are 256-color palette indices.
struct Style
{
    std::optional<std::uint8_t> fg;
    std::optional<std::uint8_t> bg;
    bool bold = false;
    bool dim = false;
    bool italic = false;
    bool inverse = false;

    [[nodiscard]] auto isPlain() const noexcept -> bool
    {
        return !fg && !bg && !bold && !dim && !italic && !inverse;
    }
};

/// @brief Renders @p style as a single SGR sequence; empty for a plain style.
[[nodiscard]] auto sgrSequence(Style const& style) -> std::string;

/// @brief Holds the terminal in synchronized output mode (DEC 2026) for one frame.
class SyncGuard
{
  public:
    explicit SyncGuard(int fd);
    ~SyncGuard();

    SyncGuard(SyncGuard const&) = delete;
    auto operator=(SyncGuard const&) -> SyncGuard& = delete;
    SyncGuard(SyncGuard&&) = delete;
    auto operator=(SyncGuard&&) -> SyncGuard& = delete;

  private:
    int _fd;
};

/// @brief Frame buffer for the interactive screen.
///
/// Drawing calls only append to an in-memory buffer; flush() hands the whole
/// frame to the descriptor at once. A negative descriptor never writes, which
/// lets widgets render into pending() for inspection.
class TerminalOutput
{
  public:
    explicit TerminalOutput(int fd);

    /// @brief Appends @p text in @p style, resetting attributes afterwards.
    void write(std::string_view text, Style const& style = {});
    void writeRaw(std::string_view text);

    /// @brief Writes @p text and pads with spaces up to @p width display columns.
    void writePadded(std::string_view text, int width, Style const& style = {});

    /// @brief Moves the cursor to a 1-based position.
    void moveTo(int row, int col);
    void clearLine();
    void clearScreen();

    void setAltScreen(bool enabled);
    void setCursorVisible(bool visible);

    /// @brief Flushes pending output, then opens a synchronized frame.
    [[nodiscard]] auto syncGuard() -> SyncGuard;

    void flush();

    [[nodiscard]] auto pending() const noexcept -> std::string_view { return _buffer; }

    [[nodiscard]] auto columns() const noexcept -> int { return _cols; }
    [[nodiscard]] auto rows() const noexcept -> int { return _rows; }

    /// @brief Re-reads the window size; keeps the last known size if the query fails.
    void updateDimensions();

  private:
    int _fd;
    std::string _buffer;
    int _cols = 80;
    int _rows = 24;
};

} // namespace lode::tui
