// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <protocol/Messages.hpp>

#include <session/EventRouter.hpp>
#include <session/RunContext.hpp>
#include <session/WorkerProcess.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace lode
{

/// @brief Summary of a finished run.
struct RunOutcome
{
    std::string runId;
    std::filesystem::path runDir;
    bool success = false;     ///< done.success, zero exit status, no failure and not cancelled.
    bool cancelled = false;   ///< Declined at confirmation or stopped by shutdown.
    bool doneSeen = false;
    bool doneSuccess = false;
    bool exitSuccess = false;
    bool reportSeen = false;
    std::size_t malformedLines = 0;
    std::optional<Error> failure; ///< Launch or synchronization failure.
};

/// @brief Drives one run from spawn to exit: writes the request, reads and routes
/// every line of worker output, then waits for the process and finalizes artifacts.
class SessionRunner
{
  public:
    SessionRunner(WorkerLaunch launch, std::filesystem::path runsRoot);

    /// @brief Executes a run on the calling thread.
    /// @param request The request to send; its runId names the artifact directory.
    /// @param context The run's context; released before the worker is waited on.
    /// @param onEvent Observer for every decoded worker event (called on this thread).
    /// @param stopToken Aborts reading and terminates the worker when triggered.
    [[nodiscard]] auto run(const Request& request,
                           RunContext& context,
                           EventRouter::EventCallback onEvent,
                           std::stop_token const& stopToken) -> RunOutcome;

    [[nodiscard]] auto runDirFor(std::string_view runId) const -> std::filesystem::path
    {
        return _runsRoot / runId;
    }

  private:
    WorkerLaunch _launch;
    std::filesystem::path _runsRoot;
};

} // namespace lode
