// SPDX-License-Identifier: Apache-2.0
#include <tui/Terminal.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace lode::tui
{

namespace
{
    // Kitty flag 1 (disambiguate) keeps a lone ESC distinguishable from sequences.
    constexpr auto EnableProtocols = std::string_view { "\033[>1u\033[?1000h\033[?1006h\033[?2004h" };
    constexpr auto DisableProtocols = std::string_view { "\033[?2004l\033[?1006l\033[?1000l\033[<u" };

    // Write end of the active terminal's self-pipe, for the signal handler.
    volatile std::sig_atomic_t gWakeFd = -1; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {};       // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void onSigwinch(int /*sig*/)
    {
        auto const savedErrno = errno;
        if (gWakeFd >= 0)
        {
            auto const byte = char { 1 };
            static_cast<void>(::write(gWakeFd, &byte, 1));
        }
        errno = savedErrno;
    }
} // namespace

Terminal::Terminal(): _output(STDOUT_FILENO)
{
}

Terminal::~Terminal()
{
    shutdown();
}

auto Terminal::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    if (!isatty(STDIN_FILENO))
        return makeError(ErrorCode::IoError, "stdin is not a terminal");

    if (tcgetattr(STDIN_FILENO, &_savedMode) != 0)
        return makeError(ErrorCode::IoError, std::format("tcgetattr failed: {}", std::strerror(errno)));

    if (pipe2(_wakePipe, O_CLOEXEC | O_NONBLOCK) != 0)
        return makeError(ErrorCode::IoError, std::format("Failed to create resize pipe: {}", std::strerror(errno)));

    auto raw = _savedMode;
    raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0)
    {
        auto const reason = std::strerror(errno);
        close(_wakePipe[0]);
        close(_wakePipe[1]);
        _wakePipe[0] = _wakePipe[1] = -1;
        return makeError(ErrorCode::IoError, std::format("Failed to enter raw mode: {}", reason));
    }

    gWakeFd = _wakePipe[1];
    struct sigaction sa {};
    sa.sa_handler = onSigwinch;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, &gPrevSigwinch);

    writeControl(EnableProtocols);
    _output.updateDimensions();
    _initialized = true;
    return {};
}

void Terminal::shutdown()
{
    if (!_initialized)
        return;

    sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
    gWakeFd = -1;

    _output.flush();
    writeControl(DisableProtocols);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &_savedMode);

    close(_wakePipe[0]);
    close(_wakePipe[1]);
    _wakePipe[0] = _wakePipe[1] = -1;
    _initialized = false;
}

auto Terminal::poll(int timeoutMs) -> std::vector<InputEvent>
{
    auto fds = std::array<pollfd, 2> {
        pollfd { .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 },
        pollfd { .fd = _wakePipe[0], .events = POLLIN, .revents = 0 },
    };

    auto const ready = ::poll(fds.data(), fds.size(), timeoutMs);
    if (ready == 0)
        return _parser.timeout();
    if (ready < 0)
        return {};

    auto events = std::vector<InputEvent> {};

    if ((fds[1].revents & POLLIN) != 0)
    {
        auto drain = std::array<char, 32> {};
        while (read(_wakePipe[0], drain.data(), drain.size()) > 0)
            ;
        _output.updateDimensions();
        events.emplace_back(ResizeEvent { .columns = _output.columns(), .rows = _output.rows() });
    }

    if ((fds[0].revents & POLLIN) != 0)
    {
        auto buffer = std::array<char, 1024> {};
        auto const n = read(STDIN_FILENO, buffer.data(), buffer.size());
        if (n > 0)
        {
            auto decoded = _parser.feed(std::string_view(buffer.data(), static_cast<std::size_t>(n)));
            events.insert(events.end(),
                          std::make_move_iterator(decoded.begin()),
                          std::make_move_iterator(decoded.end()));
        }
    }

    return events;
}

void Terminal::writeControl(std::string_view sequence)
{
    _output.writeRaw(sequence);
    _output.flush();
}

} // namespace lode::tui
