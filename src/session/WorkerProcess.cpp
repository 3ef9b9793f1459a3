// SPDX-License-Identifier: Apache-2.0
#include "WorkerProcess.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace lode
{

namespace
{
    constexpr auto ReadPollIntervalMs = 100;

    void ignoreSigpipeOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    auto exitedSuccessfully(int status) -> bool
    {
        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
} // namespace

struct WorkerProcess::Impl
{
    std::mutex writeMutex;
    int stdinWrite = -1;

    int stdoutRead = -1;
    std::string readBuffer;
    bool eof = false;

    std::mutex processMutex;
    pid_t childPid = -1;
    std::optional<int> exitStatus;
    std::string command;

    /// @brief Reaps the child without blocking. Requires processMutex.
    auto pollExitLocked() -> bool
    {
        if (exitStatus)
            return true;
        if (childPid <= 0)
            return true;
        int status = 0;
        auto const result = ::waitpid(childPid, &status, WNOHANG);
        if (result == childPid)
        {
            exitStatus = status;
            return true;
        }
        if (result < 0 && errno == ECHILD)
        {
            exitStatus = -1;
            return true;
        }
        return false;
    }
};

WorkerProcess::WorkerProcess(): _impl(std::make_unique<Impl>())
{
}

WorkerProcess::~WorkerProcess()
{
    closeInput();
    terminate();
    if (_impl->stdoutRead >= 0)
    {
        ::close(_impl->stdoutRead);
        _impl->stdoutRead = -1;
    }
}

auto WorkerProcess::start(const WorkerLaunch& launch) -> VoidResult
{
    if (_impl->childPid > 0)
        return makeError(ErrorCode::LaunchError, "Worker already started");
    if (launch.command.empty())
        return makeError(ErrorCode::LaunchError, "Worker command is empty");

    ignoreSigpipeOnce();

    int stdinPipe[2];
    int stdoutPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::LaunchError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::LaunchError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    if (launch.stderrMode == StderrMode::Discard)
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    auto argv = std::vector<char*> {};
    auto commandCopy = launch.command;
    argv.push_back(commandCopy.data());
    auto argCopies = std::vector<std::string>(launch.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Inherited environment first, overrides appended so they win on lookup.
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view { *e };
            auto const key = entry.substr(0, entry.find('='));
            if (!launch.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: launch.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = ::posix_spawnp(&pid, launch.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to spawn worker '{}': {}", launch.command, std::strerror(status)));
    }

    {
        auto const lock = std::lock_guard(_impl->processMutex);
        _impl->childPid = pid;
        _impl->exitStatus.reset();
        _impl->command = launch.command;
    }
    {
        auto const lock = std::lock_guard(_impl->writeMutex);
        _impl->stdinWrite = stdinPipe[1];
    }
    _impl->stdoutRead = stdoutPipe[0];
    _impl->readBuffer.clear();
    _impl->eof = false;

    log::info("Worker started: {} (pid {})", launch.command, pid);
    return {};
}

auto WorkerProcess::writeLine(std::string_view line) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->writeMutex);
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Worker input is closed");

    auto remaining = line;
    while (!remaining.empty())
    {
        auto const written = ::write(_impl->stdinWrite, remaining.data(), remaining.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to worker stdin: {}", std::strerror(errno)));
        }
        remaining.remove_prefix(static_cast<std::size_t>(written));
    }
    return {};
}

auto WorkerProcess::readLine(std::stop_token const& stopToken) -> Result<std::optional<std::string>>
{
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);
            return std::optional<std::string> { std::move(line) };
        }

        if (_impl->eof || _impl->stdoutRead < 0)
        {
            // A final line without a trailing newline still counts.
            if (_impl->readBuffer.empty())
                return std::optional<std::string> {};
            auto line = std::move(_impl->readBuffer);
            _impl->readBuffer.clear();
            return std::optional<std::string> { std::move(line) };
        }

        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "Read cancelled");

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, ReadPollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to poll worker stdout: {}", std::strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to read worker stdout: {}", std::strerror(errno)));
        }
        if (bytesRead == 0)
        {
            _impl->eof = true;
            continue;
        }
        _impl->readBuffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
    }
}

void WorkerProcess::closeInput()
{
    auto const lock = std::lock_guard(_impl->writeMutex);
    if (_impl->stdinWrite >= 0)
    {
        ::close(_impl->stdinWrite);
        _impl->stdinWrite = -1;
        log::debug("Worker input closed");
    }
}

auto WorkerProcess::isRunning() -> bool
{
    auto const lock = std::lock_guard(_impl->processMutex);
    return !_impl->pollExitLocked();
}

auto WorkerProcess::wait() -> Result<bool>
{
    auto const lock = std::lock_guard(_impl->processMutex);
    if (_impl->childPid <= 0)
        return makeError(ErrorCode::TransportError, "Worker was never started");

    while (!_impl->exitStatus)
    {
        int status = 0;
        auto const result = ::waitpid(_impl->childPid, &status, 0);
        if (result == _impl->childPid)
        {
            _impl->exitStatus = status;
            break;
        }
        if (result < 0 && errno != EINTR)
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to wait for worker: {}", std::strerror(errno)));
    }

    auto const success = exitedSuccessfully(*_impl->exitStatus);
    log::debug("Worker {} exited ({})", _impl->command, success ? "success" : "failure");
    return success;
}

void WorkerProcess::terminate()
{
    auto const lock = std::lock_guard(_impl->processMutex);
    if (_impl->pollExitLocked())
        return;

    log::info("Terminating worker {} (pid {})", _impl->command, _impl->childPid);
    ::kill(_impl->childPid, SIGTERM);

    auto const deadline = std::chrono::steady_clock::now() + TerminateGrace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (_impl->pollExitLocked())
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    log::warning("Worker {} ignored SIGTERM, sending SIGKILL", _impl->command);
    ::kill(_impl->childPid, SIGKILL);
    int status = 0;
    while (::waitpid(_impl->childPid, &status, 0) < 0 && errno == EINTR)
    {
    }
    _impl->exitStatus = status;
}

} // namespace lode
