// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <core/Log.hpp>
#include <core/RunId.hpp>

#include <session/SessionRunner.hpp>

namespace lode
{

Orchestrator::Orchestrator(RequestConfig requestConfig,
                           WorkerLaunch launch,
                           std::filesystem::path runsRoot,
                           Channel<SessionEvent>& events):
    _requestConfig(std::move(requestConfig)),
    _launch(std::move(launch)),
    _runsRoot(std::move(runsRoot)),
    _events(events)
{
}

Orchestrator::~Orchestrator()
{
    shutdown(std::chrono::milliseconds(0));
}

void Orchestrator::start()
{
    if (_dispatcher.joinable())
        return;
    _dispatcher = std::jthread([this](std::stop_token const& token) { dispatch(token); });
}

auto Orchestrator::submit(SessionCommand command) -> bool
{
    return _commands.send(std::move(command));
}

void Orchestrator::dispatch(std::stop_token const& stopToken)
{
    while (auto command = _commands.receive(stopToken))
    {
        if (auto* submitQuery = std::get_if<SubmitQuery>(&*command))
        {
            startRun(std::move(submitQuery->query));
        }
        else if (auto* answers = std::get_if<SubmitAnswers>(&*command))
        {
            auto run = activeRun(answers->runId);
            if (!run || !run->fulfillAnswers(std::move(answers->answers)))
                log::debug("Answers for run {} dropped", shortRunId(answers->runId));
        }
        else if (auto const* cancel = std::get_if<CancelClarification>(&*command))
        {
            auto run = activeRun(cancel->runId);
            if (!run || !run->cancelClarification())
                log::debug("Cancellation for run {} dropped", shortRunId(cancel->runId));
        }
        else if (auto const* interrupt = std::get_if<SendInterrupt>(&*command))
        {
            if (auto run = activeRun(interrupt->runId))
                run->sendInterrupt(interrupt->command);
            else
                log::debug("Interrupt for inactive run {} dropped", shortRunId(interrupt->runId));
        }
    }
}

void Orchestrator::startRun(std::string query)
{
    auto request = Request {
        .runId = generateRunId(),
        .query = std::move(query),
        .config = _requestConfig,
    };
    auto context = std::make_shared<RunContext>(request.runId);

    {
        auto const lock = std::lock_guard(_mutex);
        if (_active)
        {
            log::warning("Query ignored: run {} is still active", shortRunId(_active->runId()));
            return;
        }
        _active = context;
    }

    // The previous run thread has already published RunFinished; reap it.
    if (_runThread.joinable())
        _runThread.join();

    _events.send(RunStarted { .runId = request.runId, .runDir = _runsRoot / request.runId });
    _runThread = std::jthread([this, request = std::move(request), context](std::stop_token const& token) mutable {
        executeRun(token, std::move(request), std::move(context));
    });
}

void Orchestrator::executeRun(std::stop_token const& stopToken, Request request, std::shared_ptr<RunContext> context)
{
    auto runner = SessionRunner(_launch, _runsRoot);
    auto const runId = request.runId;
    auto outcome = runner.run(
        request,
        *context,
        [this, &runId](const WorkerEvent& event) {
            _events.send(WorkerEventNotice { .runId = runId, .event = event });
        },
        stopToken);

    // The slot is cleared before RunFinished is published.
    {
        auto const lock = std::lock_guard(_mutex);
        if (_active == context)
            _active.reset();
    }

    _events.send(RunFinished {
        .runId = runId,
        .success = outcome.success,
        .cancelled = outcome.cancelled,
        .failure = std::move(outcome.failure),
    });
}

auto Orchestrator::activeRun(std::string_view runId) const -> std::shared_ptr<RunContext>
{
    auto const lock = std::lock_guard(_mutex);
    if (_active && _active->runId() == runId)
        return _active;
    return nullptr;
}

auto Orchestrator::isRunActive() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _active != nullptr;
}

void Orchestrator::shutdown(std::chrono::milliseconds grace)
{
    auto active = std::shared_ptr<RunContext> {};
    {
        auto const lock = std::lock_guard(_mutex);
        active = _active;
    }
    if (active)
    {
        log::info("Stopping run {}", shortRunId(active->runId()));
        active->sendInterrupt(InterruptCommand::Stop);
    }

    // No new run may start once the dispatcher is gone.
    _commands.close();
    if (_dispatcher.joinable())
    {
        _dispatcher.request_stop();
        _dispatcher.join();
    }

    auto const deadline = std::chrono::steady_clock::now() + grace;
    while (isRunActive() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

    if (_runThread.joinable())
    {
        _runThread.request_stop();
        _runThread.join();
    }
}

} // namespace lode
