// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace lode::tui
{

/// @brief Key codes for keyboard events.
///
/// Printable characters carry their Unicode codepoint (cast to KeyCode).
/// Named keys live above the BMP so they never collide with a codepoint.
enum class KeyCode : std::uint32_t
{
    Enter = 0x10000,
    Tab,
    Backspace,
    Delete,
    Escape,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
};

[[nodiscard]] constexpr auto isPrintable(KeyCode key) noexcept -> bool
{
    auto const value = static_cast<std::uint32_t>(key);
    return value >= 32 && value < 0x10000 && value != 0x7F;
}

[[nodiscard]] constexpr auto keyCodeFromCodepoint(char32_t codepoint) noexcept -> KeyCode
{
    return static_cast<KeyCode>(codepoint);
}

/// @brief Bitmask of keyboard modifiers.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
    Super = 1 << 3,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(Modifier& lhs, Modifier rhs) noexcept -> Modifier&
{
    lhs = lhs | rhs;
    return lhs;
}

[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (static_cast<std::uint8_t>(mods) & static_cast<std::uint8_t>(flag)) != 0;
}

struct KeyEvent
{
    KeyCode key {};
    Modifier modifiers = Modifier::None;
    char32_t codepoint = 0; ///< 0 for named keys.

    /// @brief True for Ctrl+@p letter (lower-case ASCII).
    [[nodiscard]] constexpr auto isCtrl(char letter) const noexcept -> bool
    {
        return hasModifier(modifiers, Modifier::Ctrl) && codepoint == static_cast<char32_t>(letter);
    }
};

/// @brief Mouse input; only what the front end reacts to (clicks and the wheel).
struct MouseEvent
{
    enum class Type : std::uint8_t
    {
        Press,
        ScrollUp,
        ScrollDown,
    };

    Type type {};
    int x = 0; ///< Column (1-based).
    int y = 0; ///< Row (1-based).
};

struct ResizeEvent
{
    int columns;
    int rows;
};

/// @brief Bracketed paste content.
struct PasteEvent
{
    std::string text;
};

using InputEvent = std::variant<KeyEvent, MouseEvent, ResizeEvent, PasteEvent>;

} // namespace lode::tui
