// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/InputEvent.hpp>

namespace lode::tui
{

/// @brief Incremental decoder turning raw terminal bytes into input events.
///
/// Understands plain keys and UTF-8, CSI and SS3 cursor keys, CSI u keys
/// (kitty keyboard protocol), SGR mouse reports and bracketed paste. Input may
/// be split at any byte; state carries over between feed() calls.
class VtParser
{
  public:
    /// @brief Decodes @p data and returns every event it completes.
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<InputEvent>;

    /// @brief Resolves a pending lone ESC after the input went quiet.
    [[nodiscard]] auto timeout() -> std::vector<InputEvent>;

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        Paste,
        Utf8,
    };

    void ground(std::uint8_t byte, std::vector<InputEvent>& events);
    void escape(std::uint8_t byte, std::vector<InputEvent>& events);
    void csi(std::uint8_t byte, std::vector<InputEvent>& events);
    void ss3(std::uint8_t byte, std::vector<InputEvent>& events);
    void paste(std::uint8_t byte, std::vector<InputEvent>& events);
    void utf8(std::uint8_t byte, std::vector<InputEvent>& events);

    void finishCsi(char finalByte, std::vector<InputEvent>& events);

    State _state = State::Ground;
    std::string _params;
    std::string _pending; ///< Partial UTF-8 sequence or paste body.
    int _utf8Missing = 0;
};

} // namespace lode::tui
