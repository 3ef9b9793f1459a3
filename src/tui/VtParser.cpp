// SPDX-License-Identifier: Apache-2.0
#include <tui/VtParser.hpp>

#include <charconv>
#include <optional>
#include <ranges>

namespace lode::tui
{

namespace
{
    constexpr auto PasteBegin = std::string_view { "200" };
    constexpr auto PasteEnd = std::string_view { "\033[201~" };

    auto splitParams(std::string_view text) -> std::vector<int>
    {
        auto values = std::vector<int> {};
        for (auto const part: text | std::views::split(';'))
        {
            auto const field = std::string_view(part.begin(), part.end());
            auto value = 0;
            std::from_chars(field.data(), field.data() + field.size(), value);
            values.push_back(value);
        }
        return values;
    }

    /// @brief xterm modifier parameter: 1 + shift + 2*alt + 4*ctrl + 8*super.
    constexpr auto modifiersFromParam(int param) -> Modifier
    {
        auto const bits = param > 1 ? param - 1 : 0;
        auto mods = Modifier::None;
        if (bits & 1)
            mods |= Modifier::Shift;
        if (bits & 2)
            mods |= Modifier::Alt;
        if (bits & 4)
            mods |= Modifier::Ctrl;
        if (bits & 8)
            mods |= Modifier::Super;
        return mods;
    }

    constexpr auto cursorKey(char finalByte) -> std::optional<KeyCode>
    {
        switch (finalByte)
        {
            case 'A': return KeyCode::Up;
            case 'B': return KeyCode::Down;
            case 'C': return KeyCode::Right;
            case 'D': return KeyCode::Left;
            case 'H': return KeyCode::Home;
            case 'F': return KeyCode::End;
            default: return std::nullopt;
        }
    }

    constexpr auto tildeKey(int code) -> std::optional<KeyCode>
    {
        switch (code)
        {
            case 1:
            case 7: return KeyCode::Home;
            case 3: return KeyCode::Delete;
            case 4:
            case 8: return KeyCode::End;
            case 5: return KeyCode::PageUp;
            case 6: return KeyCode::PageDown;
            default: return std::nullopt;
        }
    }

    auto decodeUtf8(std::string_view bytes) -> char32_t
    {
        auto const lead = static_cast<std::uint8_t>(bytes[0]);
        auto cp = char32_t { 0 };
        if (bytes.size() == 2)
            cp = lead & 0x1F;
        else if (bytes.size() == 3)
            cp = lead & 0x0F;
        else
            cp = lead & 0x07;
        for (auto const ch: bytes.substr(1))
            cp = (cp << 6) | (static_cast<std::uint8_t>(ch) & 0x3F);
        return cp;
    }

    void emitChar(char32_t cp, Modifier mods, std::vector<InputEvent>& events)
    {
        events.emplace_back(KeyEvent { .key = keyCodeFromCodepoint(cp), .modifiers = mods, .codepoint = cp });
    }
} // namespace

auto VtParser::feed(std::string_view data) -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    for (auto const ch: data)
    {
        auto const byte = static_cast<std::uint8_t>(ch);
        switch (_state)
        {
            case State::Ground: ground(byte, events); break;
            case State::Escape: escape(byte, events); break;
            case State::Csi: csi(byte, events); break;
            case State::Ss3: ss3(byte, events); break;
            case State::Paste: paste(byte, events); break;
            case State::Utf8: utf8(byte, events); break;
        }
    }
    return events;
}

auto VtParser::timeout() -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    if (_state == State::Escape)
    {
        events.emplace_back(KeyEvent { .key = KeyCode::Escape });
        _state = State::Ground;
    }
    return events;
}

void VtParser::ground(std::uint8_t byte, std::vector<InputEvent>& events)
{
    switch (byte)
    {
        case 0x1B: _state = State::Escape; return;
        case '\r':
        case '\n': events.emplace_back(KeyEvent { .key = KeyCode::Enter }); return;
        case '\t': events.emplace_back(KeyEvent { .key = KeyCode::Tab }); return;
        case 0x08:
        case 0x7F: events.emplace_back(KeyEvent { .key = KeyCode::Backspace }); return;
        default: break;
    }

    if (byte < 0x20)
    {
        // C0 control: Ctrl+letter
        emitChar(static_cast<char32_t>(byte + 'a' - 1), Modifier::Ctrl, events);
        return;
    }

    if (byte < 0x80)
    {
        emitChar(static_cast<char32_t>(byte), Modifier::None, events);
        return;
    }

    if ((byte & 0xE0) == 0xC0)
        _utf8Missing = 1;
    else if ((byte & 0xF0) == 0xE0)
        _utf8Missing = 2;
    else if ((byte & 0xF8) == 0xF0)
        _utf8Missing = 3;
    else
        return; // stray continuation or invalid lead byte

    _pending.assign(1, static_cast<char>(byte));
    _state = State::Utf8;
}

void VtParser::escape(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    switch (byte)
    {
        case '[':
            _params.clear();
            _state = State::Csi;
            return;
        case 'O': _state = State::Ss3; return;
        case '\r':
        case '\n': events.emplace_back(KeyEvent { .key = KeyCode::Enter, .modifiers = Modifier::Alt }); return;
        default: break;
    }

    if (byte >= 0x20 && byte < 0x7F)
    {
        emitChar(static_cast<char32_t>(byte), Modifier::Alt, events);
        return;
    }

    events.emplace_back(KeyEvent { .key = KeyCode::Escape });
    ground(byte, events);
}

void VtParser::csi(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if (byte >= 0x20 && byte <= 0x3F)
    {
        _params += static_cast<char>(byte);
        return;
    }

    _state = State::Ground;
    if (byte >= 0x40 && byte <= 0x7E)
        finishCsi(static_cast<char>(byte), events);
}

void VtParser::ss3(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    if (auto const key = cursorKey(static_cast<char>(byte)))
        events.emplace_back(KeyEvent { .key = *key });
}

void VtParser::paste(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _pending += static_cast<char>(byte);
    if (!_pending.ends_with(PasteEnd))
        return;

    _pending.resize(_pending.size() - PasteEnd.size());
    events.emplace_back(PasteEvent { .text = std::move(_pending) });
    _pending.clear();
    _state = State::Ground;
}

void VtParser::utf8(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if ((byte & 0xC0) != 0x80)
    {
        _pending.clear();
        _state = State::Ground;
        ground(byte, events);
        return;
    }

    _pending += static_cast<char>(byte);
    if (--_utf8Missing > 0)
        return;

    emitChar(decodeUtf8(_pending), Modifier::None, events);
    _pending.clear();
    _state = State::Ground;
}

void VtParser::finishCsi(char finalByte, std::vector<InputEvent>& events)
{
    if (finalByte == '~' && _params == PasteBegin)
    {
        _pending.clear();
        _state = State::Paste;
        return;
    }

    // SGR mouse: CSI < button ; x ; y (M|m)
    if (_params.starts_with('<'))
    {
        auto const values = splitParams(std::string_view(_params).substr(1));
        if (values.size() < 3 || finalByte != 'M')
            return;
        auto const button = values[0] & 0x43;
        auto type = MouseEvent::Type::Press;
        if (button == 64)
            type = MouseEvent::Type::ScrollUp;
        else if (button == 65)
            type = MouseEvent::Type::ScrollDown;
        else if ((values[0] & 32) != 0 || button != 0)
            return; // motion, middle or right button
        events.emplace_back(MouseEvent { .type = type, .x = values[1], .y = values[2] });
        return;
    }

    if (_params.starts_with('>') || _params.starts_with('?'))
        return;

    auto const values = splitParams(_params);
    auto const mods = values.size() >= 2 ? modifiersFromParam(values[1]) : Modifier::None;

    if (finalByte == 'u')
    {
        auto const code = values.empty() ? 0 : values[0];
        switch (code)
        {
            case 9: events.emplace_back(KeyEvent { .key = KeyCode::Tab, .modifiers = mods }); return;
            case 13: events.emplace_back(KeyEvent { .key = KeyCode::Enter, .modifiers = mods }); return;
            case 27: events.emplace_back(KeyEvent { .key = KeyCode::Escape, .modifiers = mods }); return;
            case 127: events.emplace_back(KeyEvent { .key = KeyCode::Backspace, .modifiers = mods }); return;
            default: break;
        }
        if (code >= 32 && code < 0x110000)
            emitChar(static_cast<char32_t>(code), mods, events);
        return;
    }

    auto key = std::optional<KeyCode> {};
    if (finalByte == '~')
        key = values.empty() ? std::nullopt : tildeKey(values[0]);
    else
        key = cursorKey(finalByte);

    if (key)
        events.emplace_back(KeyEvent { .key = *key, .modifiers = mods });
}

} // namespace lode::tui
