// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lode::tui
{

/// @brief Number of terminal columns @p text occupies, one per grapheme cluster.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

/// @brief Longest prefix of @p text that fits into @p columns, cut at a grapheme boundary.
[[nodiscard]] auto prefixFitting(std::string_view text, int columns) -> std::string_view;

/// @brief Shortens @p text to @p width columns, ending in an ellipsis when cut.
[[nodiscard]] auto truncate(std::string_view text, int width) -> std::string;

/// @brief Word-wraps @p text to @p width columns.
///
/// Embedded newlines start a new line and are kept as empty lines when
/// repeated. Words wider than @p width are broken. Always returns at least one line.
[[nodiscard]] auto wordWrap(std::string_view text, int width) -> std::vector<std::string>;

} // namespace lode::tui
