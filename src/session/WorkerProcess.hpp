// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <session/WorkerChannel.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lode
{

/// @brief Where the worker's standard error goes.
enum class StderrMode : std::uint8_t
{
    Inherit, ///< Shares the front end's stderr (single-shot mode).
    Discard, ///< Redirected to /dev/null (interactive mode).
};

/// @brief Configuration for spawning a worker process.
struct WorkerLaunch
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    StderrMode stderrMode = StderrMode::Inherit;
};

/// @brief Worker connection backed by a child process with piped stdin/stdout.
class WorkerProcess: public WorkerChannel
{
  public:
    WorkerProcess();
    ~WorkerProcess() override;

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    /// @brief Spawns the worker process.
    /// @return Success or a LaunchError.
    [[nodiscard]] auto start(const WorkerLaunch& launch) -> VoidResult;

    [[nodiscard]] auto writeLine(std::string_view line) -> VoidResult override;
    [[nodiscard]] auto readLine(std::stop_token const& stopToken) -> Result<std::optional<std::string>> override;
    void closeInput() override;
    [[nodiscard]] auto isRunning() -> bool override;
    [[nodiscard]] auto wait() -> Result<bool> override;
    void terminate() override;

    /// @brief How long terminate() waits after SIGTERM before sending SIGKILL.
    static constexpr auto TerminateGrace = std::chrono::milliseconds(2000);

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace lode
