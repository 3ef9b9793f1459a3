// SPDX-License-Identifier: Apache-2.0
#include "Controller.hpp"

#include <core/Log.hpp>
#include <core/RunId.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>

namespace lode
{

namespace
{
    constexpr auto ConfirmTokens = std::array<std::string_view, 6> {
        "", "y", "yes", "confirm", "continue", "proceed",
    };

    constexpr auto CancelTokens = std::array<std::string_view, 5> {
        "n", "no", "cancel", "stop", "quit",
    };

    auto trim(std::string_view text) -> std::string_view
    {
        constexpr auto Whitespace = std::string_view { " \t\r\n" };
        auto const first = text.find_first_not_of(Whitespace);
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(Whitespace);
        return text.substr(first, last - first + 1);
    }

    auto formatWorkerError(const ErrorEvent& error) -> std::string
    {
        if (error.code)
            return std::format("Error [{}]: {}", *error.code, error.message);
        return std::format("Error: {}", error.message);
    }
} // namespace

auto phaseName(Phase phase) -> std::string_view
{
    switch (phase)
    {
        case Phase::Idle: return "idle";
        case Phase::AwaitingClarification: return "starting";
        case Phase::Clarifying: return "clarifying";
        case Phase::Confirming: return "confirming";
        case Phase::Researching: return "researching";
        case Phase::Completed: return "completed";
        case Phase::Error: return "error";
    }
    return "idle";
}

auto classifyConfirmation(std::string_view line) -> ConfirmationReply
{
    auto normalized = std::string(trim(line));
    std::ranges::transform(normalized, normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (std::ranges::find(ConfirmTokens, normalized) != ConfirmTokens.end())
        return ConfirmationReply::Confirm;
    if (std::ranges::find(CancelTokens, normalized) != CancelTokens.end())
        return ConfirmationReply::Cancel;
    return ConfirmationReply::Unrecognized;
}

Controller::Controller(bool autoDecide, CommandSink sink): _autoDecide(autoDecide), _sink(std::move(sink))
{
}

auto Controller::submitLine(std::string_view line) -> SubmitResult
{
    auto const trimmed = trim(line);
    if (trimmed == "/quit" || trimmed == "/exit")
        return SubmitResult::Quit;

    switch (_phase)
    {
        case Phase::Clarifying: return submitAnswer(line);
        case Phase::Confirming: return submitConfirmation(line);
        default: break;
    }

    if (_processing)
        return SubmitResult::Ignored;

    if (trimmed == "/help")
    {
        addMessage(MessageRole::System, std::string(HelpText));
        return SubmitResult::Accepted;
    }

    return submitQuery(trimmed);
}

auto Controller::submitQuery(std::string_view query) -> SubmitResult
{
    if (query.empty())
        return SubmitResult::Ignored;

    if (!send(SubmitQuery { .query = std::string(query) }))
        return SubmitResult::Ignored;

    _processing = true;
    _runId.clear();
    _runDir.clear();
    _roundSeen = false;
    _stopPending = false;
    _questions.clear();
    _questionIndex = 0;
    _answers.clear();
    _phase = Phase::AwaitingClarification;
    addMessage(MessageRole::User, std::string(query));
    setStatus("Starting research...");
    return SubmitResult::Accepted;
}

auto Controller::submitAnswer(std::string_view line) -> SubmitResult
{
    // Empty lines are valid answers ("no preference"). The answer goes out as typed.
    auto const shown = trim(line);
    addMessage(MessageRole::User, shown.empty() ? std::string("(no answer)") : std::string(shown));
    _answers.emplace_back(line);
    ++_questionIndex;

    if (_questionIndex < _questions.size())
    {
        askCurrentQuestion();
        return SubmitResult::Accepted;
    }

    if (_autoDecide)
    {
        forwardAnswers();
        return SubmitResult::Accepted;
    }

    _phase = Phase::Confirming;
    addMessage(MessageRole::Assistant, "Proceed with these answers? [Y/n]");
    setStatus("Waiting for confirmation");
    return SubmitResult::Accepted;
}

auto Controller::submitConfirmation(std::string_view line) -> SubmitResult
{
    switch (classifyConfirmation(line))
    {
        case ConfirmationReply::Confirm:
            addMessage(MessageRole::User, std::string(trim(line)));
            forwardAnswers();
            return SubmitResult::Accepted;
        case ConfirmationReply::Cancel:
            addMessage(MessageRole::User, std::string(trim(line)));
            cancelRound();
            return SubmitResult::Accepted;
        case ConfirmationReply::Unrecognized: break;
    }
    addMessage(MessageRole::System, "Please answer yes or no.");
    return SubmitResult::Ignored;
}

auto Controller::requestStop() -> bool
{
    if (!_processing)
        return false;

    // The run id is not known yet; the stop goes out with RunStarted.
    if (_runId.empty())
    {
        _stopPending = true;
        setStatus("Stopping research...");
        return true;
    }

    if (_phase == Phase::Clarifying || _phase == Phase::Confirming)
    {
        cancelRound();
        return true;
    }

    return sendStop();
}

auto Controller::sendStop() -> bool
{
    if (!send(SendInterrupt { .runId = _runId, .command = InterruptCommand::Stop }))
    {
        setStatus("Stop request could not be sent");
        return false;
    }
    setStatus("Stopping research...");
    return true;
}

void Controller::apply(const SessionEvent& event)
{
    if (auto const* started = std::get_if<RunStarted>(&event))
    {
        if (!_processing || !_runId.empty())
            return;
        _runId = started->runId;
        _runDir = started->runDir;
        log::info("Run {} started, artifacts in {}", shortRunId(_runId), _runDir.string());
        ++_revision;
        if (std::exchange(_stopPending, false))
            sendStop();
    }
    else if (auto const* notice = std::get_if<WorkerEventNotice>(&event))
    {
        if (notice->runId != _runId)
            return;
        applyWorkerEvent(notice->event);
    }
    else if (auto const* finished = std::get_if<RunFinished>(&event))
    {
        if (finished->runId != _runId)
            return;
        applyRunFinished(*finished);
    }
}

void Controller::applyWorkerEvent(const WorkerEvent& event)
{
    if (auto const* status = std::get_if<StatusEvent>(&event))
    {
        setStatus(status->message);
    }
    else if (auto const* trace = std::get_if<TraceEvent>(&event))
    {
        addMessage(MessageRole::System, std::format("Trace: {}", trace->traceUrl));
    }
    else if (auto const* questions = std::get_if<ClarifyingQuestionsEvent>(&event))
    {
        // The session blocks on the first round of a run whatever happened before it.
        if (_roundSeen || !_processing)
            return;
        beginClarifying(*questions);
    }
    else if (auto const* prompt = std::get_if<PromptEvent>(&event))
    {
        enterResearching();
        setStatus(std::format("Running {} (step {})", prompt->agent, prompt->sequence));
    }
    else if (auto const* output = std::get_if<AgentOutputEvent>(&event))
    {
        enterResearching();
        setStatus(std::format("Received {} response (step {})", output->agent, output->sequence));
    }
    else if (auto const* decision = std::get_if<DecisionEvent>(&event))
    {
        // During confirmation the decision only updates the status line.
        if (_phase != Phase::Confirming)
            enterResearching();
        setStatus(std::format("Decision: {} (searches: {}, iterations: {})",
                              decision->action,
                              decision->remainingSearches,
                              decision->remainingIterations));
    }
    else if (auto const* report = std::get_if<ReportEvent>(&event))
    {
        auto content = std::format("**{}**\n\n{}", report->shortSummary, report->markdownReport);
        if (!report->followUpQuestions.empty())
        {
            content += "\n\nFollow-up questions:";
            for (auto const& question: report->followUpQuestions)
                content += std::format("\n- {}", question);
        }
        setStatus(std::nullopt);
        addMessage(MessageRole::Assistant, std::move(content));
    }
    else if (auto const* error = std::get_if<ErrorEvent>(&event))
    {
        addMessage(MessageRole::System, formatWorkerError(*error));
        if (_phase == Phase::Researching || _phase == Phase::AwaitingClarification)
            _phase = Phase::Error;
    }
    else if (auto const* metadata = std::get_if<MetadataEvent>(&event))
    {
        log::debug("Run {}: model {}, {} ms", shortRunId(_runId), metadata->model, metadata->durationMs);
    }
}

void Controller::applyRunFinished(const RunFinished& finished)
{
    _processing = false;
    _stopPending = false;
    _questions.clear();
    _answers.clear();
    _questionIndex = 0;
    setStatus(std::nullopt);

    if (finished.cancelled)
    {
        _phase = Phase::Completed;
        addMessage(MessageRole::System, "Research cancelled");
    }
    else if (finished.failure)
    {
        _phase = Phase::Error;
        addMessage(MessageRole::System,
                   std::format("Error [{}]: {}", errorCodeName(finished.failure->code), finished.failure->message));
    }
    else if (finished.success)
    {
        _phase = Phase::Completed;
        addMessage(MessageRole::System, std::format("Research complete ({})", shortRunId(finished.runId)));
    }
    else
    {
        _phase = Phase::Error;
        addMessage(MessageRole::System, "Research failed");
    }
}

void Controller::beginClarifying(const ClarifyingQuestionsEvent& event)
{
    _roundSeen = true;
    // An empty round is answered by the session itself.
    if (event.questions.empty())
        return;

    _questions = event.questions;
    _questionIndex = 0;
    _answers.clear();
    _phase = Phase::Clarifying;
    addMessage(MessageRole::System,
               std::format("{} clarifying question{} before research starts",
                           _questions.size(),
                           _questions.size() == 1 ? "" : "s"));
    askCurrentQuestion();
}

void Controller::askCurrentQuestion()
{
    auto const& question = _questions[_questionIndex];
    addMessage(MessageRole::Assistant,
               std::format("({}/{}) {}", _questionIndex + 1, _questions.size(), question.question));
    setStatus(std::format("Clarifying: {}", question.label));
}

void Controller::forwardAnswers()
{
    if (!send(SubmitAnswers { .runId = _runId, .answers = _answers }))
        log::warning("Clarifying answers could not be queued");
    _questions.clear();
    _questionIndex = 0;
    _answers.clear();
    _phase = Phase::Researching;
    setStatus("Answers sent, researching...");
}

void Controller::cancelRound()
{
    if (!send(CancelClarification { .runId = _runId }))
        log::warning("Cancellation could not be queued");
    _questions.clear();
    _questionIndex = 0;
    _answers.clear();
    _phase = Phase::Completed;
    setStatus("Cancelling research...");
}

void Controller::enterResearching()
{
    if (_phase == Phase::AwaitingClarification)
        _phase = Phase::Researching;
}

auto Controller::currentQuestion() const -> const ClarifyingQuestion*
{
    if (_phase != Phase::Clarifying || _questionIndex >= _questions.size())
        return nullptr;
    return &_questions[_questionIndex];
}

auto Controller::inputTitle() const -> std::string
{
    if (auto const* question = currentQuestion())
        return question->label;
    if (_phase == Phase::Confirming)
        return "Confirm";
    return "Query";
}

auto Controller::inputEnabled() const noexcept -> bool
{
    return !_processing || _phase == Phase::Clarifying || _phase == Phase::Confirming;
}

void Controller::addMessage(MessageRole role, std::string text)
{
    _messages.push_back(ChatMessage { .role = role, .text = std::move(text) });
    ++_revision;
}

void Controller::setStatus(std::optional<std::string> status)
{
    _status = std::move(status);
    ++_revision;
}

auto Controller::send(SessionCommand command) -> bool
{
    return _sink && _sink(std::move(command));
}

} // namespace lode
