// SPDX-License-Identifier: Apache-2.0
#include "SessionRunner.hpp"

#include <core/Log.hpp>
#include <core/RunId.hpp>

#include <session/ArtifactSink.hpp>

#include <format>

namespace lode
{

SessionRunner::SessionRunner(WorkerLaunch launch, std::filesystem::path runsRoot):
    _launch(std::move(launch)), _runsRoot(std::move(runsRoot))
{
}

auto SessionRunner::run(const Request& request,
                        RunContext& context,
                        EventRouter::EventCallback onEvent,
                        std::stop_token const& stopToken) -> RunOutcome
{
    auto outcome = RunOutcome { .runId = request.runId, .runDir = runDirFor(request.runId) };
    auto const id = shortRunId(request.runId);

    auto sink = ArtifactSink(_runsRoot, request.runId);
    if (auto prepared = sink.prepare(); !prepared)
        log::warning("failed to create run directory: {}", prepared.error().message);
    else if (auto written = sink.writeRequest(request); !written)
        log::warning("failed to write request: {}", written.error().message);

    auto worker = WorkerProcess {};
    if (auto started = worker.start(_launch); !started)
    {
        log::debug("Run {}: {}", id, started.error());
        outcome.failure = started.error();
        context.release();
        return outcome;
    }

    // The request must be the first line the worker sees.
    if (auto sent = worker.writeLine(encodeRequest(request)); !sent)
    {
        log::debug("Run {}: failed to send request: {}", id, sent.error().message);
        outcome.failure = Error { .code = ErrorCode::LaunchError,
                                  .message = std::format("Failed to send request: {}", sent.error().message) };
        context.release();
        worker.closeInput();
        worker.terminate();
        if (auto exited = worker.wait(); !exited)
            log::warning("Run {}: {}", id, exited.error());
        return outcome;
    }
    log::info("Run {} started", id);

    context.bindWorker(worker);
    auto router = EventRouter(context, sink, worker, std::move(onEvent));

    while (true)
    {
        auto line = worker.readLine(stopToken);
        if (!line)
        {
            if (line.error().code == ErrorCode::Cancelled)
                outcome.cancelled = true;
            else
                outcome.failure = line.error();
            break;
        }
        if (!*line)
            break;

        if (auto routed = router.handleLine(**line, stopToken); !routed)
        {
            if (routed.error().code == ErrorCode::Cancelled)
                outcome.cancelled = true;
            else
                outcome.failure = routed.error();
            break;
        }
    }

    context.release();
    worker.closeInput();
    if (outcome.failure || outcome.cancelled || stopToken.stop_requested())
        worker.terminate();

    if (auto exited = worker.wait(); exited)
        outcome.exitSuccess = *exited;
    else
        log::warning("Run {}: {}", id, exited.error());

    if (auto finalized = sink.finalize(); !finalized)
        log::warning("failed to write metadata: {}", finalized.error().message);

    outcome.cancelled = outcome.cancelled || router.cancelled();
    outcome.doneSeen = router.doneSeen();
    outcome.doneSuccess = router.doneSuccess();
    outcome.reportSeen = router.reportSeen();
    outcome.malformedLines = router.malformedLines();
    outcome.success = outcome.doneSeen && outcome.doneSuccess && outcome.exitSuccess && !outcome.failure
                      && !outcome.cancelled;

    if (outcome.failure)
        log::debug("Run {} failed: {}", id, *outcome.failure);
    else
        log::info("Run {} finished (success: {}, cancelled: {})", id, outcome.success, outcome.cancelled);
    return outcome;
}

} // namespace lode
