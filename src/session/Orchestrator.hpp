// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>

#include <protocol/Messages.hpp>

#include <session/RunContext.hpp>
#include <session/SessionEvents.hpp>
#include <session/WorkerProcess.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

namespace lode
{

/// @brief Background task turning Controller commands into runs.
///
/// A dispatcher thread consumes the command funnel. At most one run is
/// active; it executes on its own thread and reports back through the event
/// channel. Commands addressed to any run other than the active one are ignored.
class Orchestrator
{
  public:
    Orchestrator(RequestConfig requestConfig,
                 WorkerLaunch launch,
                 std::filesystem::path runsRoot,
                 Channel<SessionEvent>& events);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Starts the dispatcher thread.
    void start();

    /// @brief Queues a command for the dispatcher.
    /// @return False once the orchestrator has been shut down.
    auto submit(SessionCommand command) -> bool;

    /// @brief Stops the active run (stop interrupt, then forced after @p grace) and the dispatcher.
    void shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] auto isRunActive() const -> bool;

    [[nodiscard]] auto requestConfig() const -> const RequestConfig& { return _requestConfig; }

  private:
    void dispatch(std::stop_token const& stopToken);
    void startRun(std::string query);
    void executeRun(std::stop_token const& stopToken, Request request, std::shared_ptr<RunContext> context);
    [[nodiscard]] auto activeRun(std::string_view runId) const -> std::shared_ptr<RunContext>;

    RequestConfig _requestConfig;
    WorkerLaunch _launch;
    std::filesystem::path _runsRoot;
    Channel<SessionEvent>& _events;
    Channel<SessionCommand> _commands;

    mutable std::mutex _mutex;
    std::shared_ptr<RunContext> _active;

    std::jthread _runThread;
    std::jthread _dispatcher;
};

} // namespace lode
