// SPDX-License-Identifier: Apache-2.0
#include "ConsoleOutput.hpp"

#include <core/RunId.hpp>

#include <nlohmann/json.hpp>

#include <print>
#include <string>

namespace lode
{

namespace
{
    void emitJson(std::FILE* out, const nlohmann::ordered_json& message)
    {
        std::println(out, "{}", message.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
        std::fflush(out);
    }
} // namespace

auto selectOutputMode(bool json, bool quiet) -> OutputMode
{
    if (json)
        return OutputMode::Json;
    if (quiet)
        return OutputMode::Quiet;
    return OutputMode::Human;
}

ConsoleOutput::ConsoleOutput(OutputMode mode, std::FILE* out, std::FILE* err): _mode(mode), _out(out), _err(err)
{
}

void ConsoleOutput::start(std::string_view runId,
                          const std::filesystem::path& artifactsDir,
                          const RequestConfig& config)
{
    switch (_mode)
    {
        case OutputMode::Human:
            std::println(_err, "Starting research run: {}", runId);
            std::println(_err,
                         "Model: {}, Searches: {} (max: {}), Iterations: {}",
                         config.model,
                         config.searchCount,
                         config.maxSearches,
                         config.maxIterations);
            std::println(_err, "Artifacts: {}", artifactsDir.string());
            break;
        case OutputMode::Quiet: break;
        case OutputMode::Json:
            emitJson(_out,
                     {
                         { "type", "start" },
                         { "version", ProtocolVersion },
                         { "run_id", runId },
                         { "artifacts_dir", artifactsDir.string() },
                         { "model", config.model },
                         { "search_count", config.searchCount },
                         { "max_iterations", config.maxIterations },
                         { "max_searches", config.maxSearches },
                         { "auto_decide", config.autoDecide },
                     });
            break;
    }
}

void ConsoleOutput::event(const WorkerEvent& event)
{
    if (auto const* e = std::get_if<StatusEvent>(&event))
        status(e->message);
    else if (auto const* e = std::get_if<TraceEvent>(&event))
        trace(e->traceId, e->traceUrl);
    else if (auto const* e = std::get_if<PromptEvent>(&event))
        prompt(e->agent, e->sequence);
    else if (auto const* e = std::get_if<AgentOutputEvent>(&event))
        response(e->agent, e->sequence);
    else if (auto const* e = std::get_if<DecisionEvent>(&event))
        decision(e->action, e->reason, e->remainingSearches, e->remainingIterations);
    else if (auto const* e = std::get_if<ReportEvent>(&event))
        report(e->shortSummary, e->markdownReport, e->followUpQuestions);
    else if (auto const* e = std::get_if<ErrorEvent>(&event))
        error(e->code ? std::optional<std::string_view> { *e->code } : std::nullopt, e->message);
}

void ConsoleOutput::status(std::string_view message)
{
    switch (_mode)
    {
        case OutputMode::Human: std::println(_err, "-> {}", message); break;
        case OutputMode::Quiet: break;
        case OutputMode::Json: emitJson(_out, { { "type", "status" }, { "message", message } }); break;
    }
}

void ConsoleOutput::trace(std::string_view traceId, std::string_view traceUrl)
{
    switch (_mode)
    {
        case OutputMode::Human: std::println(_err, "Trace [{}]: {}", shortRunId(traceId), traceUrl); break;
        case OutputMode::Quiet: break;
        case OutputMode::Json:
            emitJson(_out, { { "type", "trace" }, { "trace_id", traceId }, { "trace_url", traceUrl } });
            break;
    }
}

void ConsoleOutput::prompt(std::string_view agent, std::uint32_t sequence)
{
    switch (_mode)
    {
        case OutputMode::Human: std::println(_err, "Prompt: {} ({})", agent, sequence); break;
        case OutputMode::Quiet: break;
        case OutputMode::Json:
            emitJson(_out, { { "type", "prompt" }, { "agent", agent }, { "sequence", sequence } });
            break;
    }
}

void ConsoleOutput::response(std::string_view agent, std::uint32_t sequence)
{
    switch (_mode)
    {
        case OutputMode::Human: std::println(_err, "Response: {} ({})", agent, sequence); break;
        case OutputMode::Quiet: break;
        case OutputMode::Json:
            emitJson(_out, { { "type", "response" }, { "agent", agent }, { "sequence", sequence } });
            break;
    }
}

void ConsoleOutput::decision(std::string_view action,
                             std::string_view reason,
                             std::uint32_t remainingSearches,
                             std::uint32_t remainingIterations)
{
    switch (_mode)
    {
        case OutputMode::Human:
            std::println(_err,
                         "Decision: {} (searches: {}, iterations: {})",
                         action,
                         remainingSearches,
                         remainingIterations);
            std::println(_err, "   Reason: {}", reason);
            break;
        case OutputMode::Quiet: break;
        case OutputMode::Json:
            emitJson(_out,
                     {
                         { "type", "decision" },
                         { "action", action },
                         { "reason", reason },
                         { "remaining_searches", remainingSearches },
                         { "remaining_iterations", remainingIterations },
                     });
            break;
    }
}

void ConsoleOutput::report(std::string_view shortSummary,
                           std::string_view markdownReport,
                           const std::vector<std::string>& followUpQuestions)
{
    if (_mode == OutputMode::Json)
    {
        emitJson(_out,
                 {
                     { "type", "report" },
                     { "short_summary", shortSummary },
                     { "markdown_report", markdownReport },
                     { "follow_up_questions", followUpQuestions },
                 });
        return;
    }

    std::println(_out, "\n{}\n", std::string(60, '='));
    std::println(_out, "SUMMARY: {}\n", shortSummary);
    std::println(_out, "{}", markdownReport);
    if (!followUpQuestions.empty())
    {
        std::println(_out, "\nFollow-up questions:");
        for (auto const& question: followUpQuestions)
            std::println(_out, "  - {}", question);
    }
    std::fflush(_out);
}

void ConsoleOutput::error(std::optional<std::string_view> code, std::string_view message)
{
    if (_mode == OutputMode::Json)
    {
        auto msg = nlohmann::ordered_json { { "type", "error" } };
        if (code)
            msg["code"] = *code;
        msg["message"] = message;
        emitJson(_out, msg);
        return;
    }

    if (code)
        std::println(_err, "Error [{}]: {}", *code, message);
    else
        std::println(_err, "Error: {}", message);
}

void ConsoleOutput::warning(std::string_view message)
{
    switch (_mode)
    {
        case OutputMode::Human: std::println(_err, "Warning: {}", message); break;
        case OutputMode::Quiet: break;
        case OutputMode::Json: emitJson(_out, { { "type", "warning" }, { "message", message } }); break;
    }
}

void ConsoleOutput::complete(bool success, std::string_view runId, const std::filesystem::path& artifactsDir)
{
    switch (_mode)
    {
        case OutputMode::Human: std::println(_err, "Run complete. Artifacts saved to: {}", artifactsDir.string()); break;
        case OutputMode::Quiet: break;
        case OutputMode::Json:
            emitJson(_out,
                     {
                         { "type", "complete" },
                         { "success", success },
                         { "run_id", runId },
                         { "artifacts_dir", artifactsDir.string() },
                     });
            break;
    }
}

} // namespace lode
