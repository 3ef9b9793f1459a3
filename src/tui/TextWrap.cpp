// SPDX-License-Identifier: Apache-2.0
#include <tui/TextWrap.hpp>

#include <libunicode/utf8_grapheme_segmenter.h>

namespace lode::tui
{

namespace
{
    auto isBlank(char ch) -> bool
    {
        return ch == ' ' || ch == '\t' || ch == '\r';
    }

    void wrapParagraph(std::string_view paragraph, int width, std::vector<std::string>& lines)
    {
        auto const firstLine = lines.size();
        auto current = std::string {};
        auto currentWidth = 0;

        auto const flushLine = [&]() {
            lines.push_back(std::move(current));
            current.clear();
            currentWidth = 0;
        };

        auto pos = std::size_t { 0 };
        while (pos < paragraph.size())
        {
            while (pos < paragraph.size() && isBlank(paragraph[pos]))
                ++pos;
            auto end = pos;
            while (end < paragraph.size() && !isBlank(paragraph[end]))
                ++end;
            if (end == pos)
                break;

            auto word = paragraph.substr(pos, end - pos);
            pos = end;

            auto wordWidth = displayWidth(word);
            if (!current.empty() && currentWidth + 1 + wordWidth > width)
                flushLine();

            while (wordWidth > width)
            {
                auto const head = prefixFitting(word, width - currentWidth);
                if (head.empty())
                {
                    flushLine();
                    continue;
                }
                current += head;
                word.remove_prefix(head.size());
                flushLine();
                wordWidth = displayWidth(word);
            }

            if (!current.empty())
            {
                current += ' ';
                ++currentWidth;
            }
            current += word;
            currentWidth += wordWidth;
        }

        if (!current.empty() || lines.size() == firstLine)
            lines.push_back(std::move(current));
    }
} // namespace

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;
    auto segmenter = unicode::utf8_grapheme_segmenter(text);
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        ++width;
    return width;
}

auto prefixFitting(std::string_view text, int columns) -> std::string_view
{
    if (columns <= 0)
        return {};

    auto used = 0;
    auto segmenter = unicode::utf8_grapheme_segmenter(text);
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
    {
        if (used == columns)
            return text.substr(0, static_cast<std::size_t>(it._clusterStart - text.data()));
        ++used;
    }
    return text;
}

auto truncate(std::string_view text, int width) -> std::string
{
    if (width <= 0)
        return {};
    if (displayWidth(text) <= width)
        return std::string(text);
    if (width == 1)
        return "…";
    return std::string(prefixFitting(text, width - 1)) + "…";
}

auto wordWrap(std::string_view text, int width) -> std::vector<std::string>
{
    auto lines = std::vector<std::string> {};
    if (width <= 0)
    {
        lines.emplace_back(text);
        return lines;
    }

    auto start = std::size_t { 0 };
    while (true)
    {
        auto const newline = text.find('\n', start);
        auto const paragraph = text.substr(start, newline == std::string_view::npos ? text.npos : newline - start);
        wrapParagraph(paragraph, width, lines);
        if (newline == std::string_view::npos)
            break;
        start = newline + 1;
    }
    return lines;
}

} // namespace lode::tui
