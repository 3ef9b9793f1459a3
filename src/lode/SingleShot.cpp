// SPDX-License-Identifier: Apache-2.0
#include "SingleShot.hpp"

#include <core/Log.hpp>
#include <core/RunId.hpp>

#include <session/RunContext.hpp>
#include <session/SessionRunner.hpp>

#include <iostream>
#include <print>

namespace lode
{

auto makeWorkerLaunch(const WorkerConfig& worker, StderrMode stderrMode) -> WorkerLaunch
{
    return WorkerLaunch {
        .command = worker.command,
        .args = worker.args,
        .env = worker.env,
        .stderrMode = stderrMode,
    };
}

auto collectAnswers(const std::vector<ClarifyingQuestion>& questions,
                    std::istream& in,
                    std::FILE* prompt,
                    bool interactive) -> std::vector<std::string>
{
    auto answers = std::vector<std::string> {};
    answers.reserve(questions.size());

    for (auto const& question: questions)
    {
        auto answer = std::string {};
        if (interactive)
        {
            std::print(prompt, "\n{}: {}\n> ", question.label, question.question);
            std::fflush(prompt);
            if (!std::getline(in, answer))
            {
                interactive = false;
                answer.clear();
            }
        }
        answers.push_back(std::move(answer));
    }
    return answers;
}

auto runSingleShot(const AppConfig& config, std::string query, OutputMode mode, bool interactiveStdin) -> int
{
    auto output = ConsoleOutput(mode);

    // Warnings and errors become part of the run's console output.
    auto const logSink = log::ScopedSink([&output, mode](log::Level level, std::string_view message) {
        switch (level)
        {
            case log::Level::Error: output.error(std::nullopt, message); break;
            case log::Level::Warning: output.warning(message); break;
            default:
                if (mode != OutputMode::Json)
                    std::println(stderr, "{}", message);
                break;
        }
    });

    auto request = Request {
        .runId = generateRunId(),
        .query = std::move(query),
        .config = config.request,
    };

    auto runner = SessionRunner(makeWorkerLaunch(config.worker, StderrMode::Inherit), config.runsDir);
    auto const runDir = runner.runDirFor(request.runId);
    output.start(request.runId, runDir, request.config);

    auto const askOnStdin = interactiveStdin && mode == OutputMode::Human;
    auto context = RunContext(request.runId);
    auto outcome = runner.run(
        request,
        context,
        [&](const WorkerEvent& event) {
            output.event(event);
            auto const* questions = std::get_if<ClarifyingQuestionsEvent>(&event);
            if (questions && context.hasPendingClarification())
                context.fulfillAnswers(collectAnswers(questions->questions, std::cin, stderr, askOnStdin));
        },
        std::stop_token {});

    if (outcome.failure)
        output.error(errorCodeName(outcome.failure->code), outcome.failure->message);

    output.complete(outcome.success, request.runId, runDir);
    return outcome.success ? 0 : 1;
}

} // namespace lode
