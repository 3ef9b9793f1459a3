// SPDX-License-Identifier: Apache-2.0
#include <tui/InputField.hpp>

#include <algorithm>
#include <iterator>

#include <libunicode/utf8_grapheme_segmenter.h>

namespace lode::tui
{

namespace
{
    auto encodeUtf8(char32_t cp) -> std::string
    {
        auto out = std::string {};
        if (cp < 0x80)
            out += static_cast<char>(cp);
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x110000)
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        return out;
    }

    auto isSpace(char ch) -> bool
    {
        return ch == ' ' || ch == '\t';
    }
} // namespace

auto InputField::processEvent(InputEvent const& event) -> InputFieldAction
{
    if (auto const* key = std::get_if<KeyEvent>(&event))
        return handleKey(*key);

    if (auto const* paste = std::get_if<PasteEvent>(&event))
    {
        // Single line: pasted line breaks become spaces.
        auto text = paste->text;
        std::ranges::replace(text, '\n', ' ');
        std::erase(text, '\r');
        insert(text);
        return InputFieldAction::Changed;
    }

    return InputFieldAction::None;
}

void InputField::clear()
{
    _buffer.clear();
    _cursor = 0;
    _scroll = 0;
}

void InputField::setText(std::string_view text)
{
    _buffer = std::string(text);
    _cursor = _buffer.size();
}

void InputField::addHistory(std::string entry)
{
    if (!entry.empty() && (_history.empty() || _history.back() != entry))
    {
        _history.push_back(std::move(entry));
        if (_history.size() > MaxHistory)
            _history.erase(_history.begin());
    }
    _historyIndex = _history.size();
    _draft.clear();
}

auto InputField::view(int width) -> InputView
{
    auto const bounds = boundaries();
    auto const total = static_cast<int>(bounds.size()) - 1;
    auto const cursorIndex =
        static_cast<int>(std::ranges::lower_bound(bounds, _cursor) - bounds.begin());

    width = std::max(width, 1);
    if (cursorIndex < _scroll)
        _scroll = cursorIndex;
    else if (cursorIndex >= _scroll + width)
        _scroll = cursorIndex - width + 1;
    _scroll = std::clamp(_scroll, 0, std::max(0, total));

    auto const first = bounds[static_cast<std::size_t>(_scroll)];
    auto const last = bounds[static_cast<std::size_t>(std::min(total, _scroll + width))];
    return InputView {
        .text = std::string_view(_buffer).substr(first, last - first),
        .cursorColumn = cursorIndex - _scroll,
    };
}

auto InputField::handleKey(KeyEvent const& key) -> InputFieldAction
{
    auto const ctrl = hasModifier(key.modifiers, Modifier::Ctrl);
    auto const alt = hasModifier(key.modifiers, Modifier::Alt);

    switch (key.key)
    {
        case KeyCode::Enter: return InputFieldAction::Submit;
        case KeyCode::Backspace:
            if (ctrl || alt)
                killWordBackward();
            else
                deleteBackward();
            return InputFieldAction::Changed;
        case KeyCode::Delete: deleteForward(); return InputFieldAction::Changed;
        case KeyCode::Left: _cursor = prevBoundary(_cursor); return InputFieldAction::Changed;
        case KeyCode::Right: _cursor = nextBoundary(_cursor); return InputFieldAction::Changed;
        case KeyCode::Home: _cursor = 0; return InputFieldAction::Changed;
        case KeyCode::End: _cursor = _buffer.size(); return InputFieldAction::Changed;
        default: break;
    }

    if (ctrl)
    {
        switch (key.codepoint)
        {
            case 'a': _cursor = 0; return InputFieldAction::Changed;
            case 'e': _cursor = _buffer.size(); return InputFieldAction::Changed;
            case 'b': _cursor = prevBoundary(_cursor); return InputFieldAction::Changed;
            case 'f': _cursor = nextBoundary(_cursor); return InputFieldAction::Changed;
            case 'h': deleteBackward(); return InputFieldAction::Changed;
            case 'k': killToEnd(); return InputFieldAction::Changed;
            case 'u': killToStart(); return InputFieldAction::Changed;
            case 'w': killWordBackward(); return InputFieldAction::Changed;
            case 'p': historyPrev(); return InputFieldAction::Changed;
            case 'n': historyNext(); return InputFieldAction::Changed;
            case 'c': return InputFieldAction::Abort;
            case 'd':
                if (_buffer.empty())
                    return InputFieldAction::Eof;
                deleteForward();
                return InputFieldAction::Changed;
            default: return InputFieldAction::None;
        }
    }

    if (alt || key.codepoint < 32 || key.codepoint == 0x7F)
        return InputFieldAction::None;

    insert(encodeUtf8(key.codepoint));
    return InputFieldAction::Changed;
}

void InputField::insert(std::string_view text)
{
    _buffer.insert(_cursor, text);
    _cursor += text.size();
}

void InputField::deleteForward()
{
    auto const next = nextBoundary(_cursor);
    _buffer.erase(_cursor, next - _cursor);
}

void InputField::deleteBackward()
{
    auto const prev = prevBoundary(_cursor);
    _buffer.erase(prev, _cursor - prev);
    _cursor = prev;
}

void InputField::killToEnd()
{
    _buffer.erase(_cursor);
}

void InputField::killToStart()
{
    _buffer.erase(0, _cursor);
    _cursor = 0;
}

void InputField::killWordBackward()
{
    auto start = _cursor;
    while (start > 0 && isSpace(_buffer[start - 1]))
        --start;
    while (start > 0 && !isSpace(_buffer[start - 1]))
        --start;
    _buffer.erase(start, _cursor - start);
    _cursor = start;
}

void InputField::historyPrev()
{
    if (_historyIndex == 0)
        return;
    if (_historyIndex == _history.size())
        _draft = _buffer;
    setText(_history[--_historyIndex]);
}

void InputField::historyNext()
{
    if (_historyIndex >= _history.size())
        return;
    ++_historyIndex;
    setText(_historyIndex == _history.size() ? _draft : _history[_historyIndex]);
}

auto InputField::boundaries() const -> std::vector<std::size_t>
{
    auto result = std::vector<std::size_t> {};
    auto const text = std::string_view(_buffer);
    auto segmenter = unicode::utf8_grapheme_segmenter(text);
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        result.push_back(static_cast<std::size_t>(it._clusterStart - text.data()));
    if (result.empty() || result.back() != text.size())
        result.push_back(text.size());
    return result;
}

auto InputField::nextBoundary(std::size_t pos) const -> std::size_t
{
    auto const bounds = boundaries();
    auto const it = std::ranges::upper_bound(bounds, pos);
    return it == bounds.end() ? _buffer.size() : *it;
}

auto InputField::prevBoundary(std::size_t pos) const -> std::size_t
{
    if (pos == 0)
        return 0;
    auto const bounds = boundaries();
    auto const it = std::ranges::lower_bound(bounds, pos);
    return *std::prev(it);
}

} // namespace lode::tui
