// SPDX-License-Identifier: Apache-2.0
#include "EventRouter.hpp"

#include <core/Log.hpp>
#include <core/RunId.hpp>

#include <format>

namespace lode
{

namespace
{
    void warnOnFailure(const VoidResult& result, std::string_view what)
    {
        if (!result)
            log::warning("failed to write {}: {}", what, result.error().message);
    }
} // namespace

EventRouter::EventRouter(RunContext& context, ArtifactSink& sink, WorkerChannel& worker, EventCallback onEvent):
    _context(context), _sink(sink), _worker(worker), _onEvent(std::move(onEvent))
{
}

auto EventRouter::handleLine(std::string_view line, std::stop_token const& stopToken) -> VoidResult
{
    auto event = decodeEvent(line);
    if (!event)
    {
        ++_malformedLines;
        log::warning("failed to parse response: {} (line: {})", event.error().message, line);
        return {};
    }
    return route(*event, stopToken);
}

auto EventRouter::route(const WorkerEvent& event, std::stop_token const& stopToken) -> VoidResult
{
    // The round must be open before the observer sees the questions.
    auto const* questions = std::get_if<ClarifyingQuestionsEvent>(&event);
    auto handoff = std::shared_ptr<AnswerHandoff> {};
    if (questions && !_answersSent && !_cancelled)
        handoff = _context.openClarification();

    if (_onEvent)
        _onEvent(event);

    persist(event);

    if (questions)
    {
        if (!handoff)
        {
            log::debug("Ignoring repeated clarifying round for run {}", shortRunId(_context.runId()));
            return {};
        }
        return awaitAnswers(*questions, *handoff, stopToken);
    }

    if (auto const* done = std::get_if<DoneEvent>(&event))
    {
        _doneSeen = true;
        _doneSuccess = done->success;
    }
    return {};
}

void EventRouter::persist(const WorkerEvent& event)
{
    if (auto const* prompt = std::get_if<PromptEvent>(&event))
        warnOnFailure(_sink.writePrompt(*prompt), "prompt");
    else if (auto const* output = std::get_if<AgentOutputEvent>(&event))
        warnOnFailure(_sink.writeAgentOutput(*output), "response");
    else if (auto const* report = std::get_if<ReportEvent>(&event))
    {
        _reportSeen = true;
        warnOnFailure(_sink.writeReport(*report), "report");
    }
    else if (auto const* trace = std::get_if<TraceEvent>(&event))
        _sink.noteTrace(*trace);
    else if (auto const* metadata = std::get_if<MetadataEvent>(&event))
        _sink.noteMetadata(*metadata);
}

auto EventRouter::awaitAnswers(const ClarifyingQuestionsEvent& event,
                               AnswerHandoff& handoff,
                               std::stop_token const& stopToken) -> VoidResult
{
    if (event.questions.empty())
    {
        handoff.fulfill({});
        return sendAnswers({});
    }

    log::debug("Awaiting {} clarifying answers for run {}", event.questions.size(), shortRunId(_context.runId()));

    while (true)
    {
        if (auto result = handoff.waitFor(HandoffPollInterval))
        {
            switch (result->outcome)
            {
                case HandoffOutcome::Answered:
                    if (result->answers.size() != event.questions.size())
                        log::warning("Sending {} answers for {} clarifying questions",
                                     result->answers.size(),
                                     event.questions.size());
                    return sendAnswers(result->answers);
                case HandoffOutcome::Cancelled: cancelRun(); return {};
                case HandoffOutcome::Abandoned:
                    return makeError(ErrorCode::SyncError, "Clarifying round abandoned before it was answered");
            }
        }

        if (stopToken.stop_requested())
        {
            handoff.abandon();
            return makeError(ErrorCode::Cancelled, "Run stopped while awaiting clarifying answers");
        }
        if (!_worker.isRunning())
        {
            if (handoff.abandon())
                return makeError(ErrorCode::SyncError, "Worker exited while awaiting clarifying answers");
            // Resolved concurrently; pick up the outcome on the next iteration.
        }
    }
}

auto EventRouter::sendAnswers(const std::vector<std::string>& answers) -> VoidResult
{
    if (auto result = _worker.writeLine(encodeAnswers(answers)); !result)
        return makeError(ErrorCode::SyncError, std::format("Failed to send clarifying answers: {}", result.error().message));
    _answersSent = true;
    log::debug("Sent {} clarifying answers", answers.size());
    return {};
}

void EventRouter::cancelRun()
{
    log::info("Run {} cancelled at confirmation", shortRunId(_context.runId()));
    _cancelled = true;
    if (auto result = _worker.writeLine(encodeInterrupt(InterruptCommand::Stop)); !result)
        log::debug("Stop interrupt not delivered: {}", result.error().message);
    _worker.closeInput();
    _worker.terminate();
}

} // namespace lode
