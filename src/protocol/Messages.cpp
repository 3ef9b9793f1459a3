// SPDX-License-Identifier: Apache-2.0
#include "Messages.hpp"

#include <core/JsonUtils.hpp>

#include <array>
#include <format>
#include <utility>

namespace lode
{

namespace
{
    /// @brief Trims surrounding whitespace (including a trailing CR from CRLF workers).
    auto trimLine(std::string_view line) -> std::string_view
    {
        constexpr auto Whitespace = std::string_view { " \t\r\n" };
        auto const first = line.find_first_not_of(Whitespace);
        if (first == std::string_view::npos)
            return {};
        auto const last = line.find_last_not_of(Whitespace);
        return line.substr(first, last - first + 1);
    }

    auto decodeStatus(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto message = json::getString(obj, "message");
        if (!message)
            return std::unexpected(message.error());
        return StatusEvent { .message = std::move(*message) };
    }

    auto decodeTrace(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto traceId = json::getString(obj, "trace_id");
        if (!traceId)
            return std::unexpected(traceId.error());
        auto traceUrl = json::getString(obj, "trace_url");
        if (!traceUrl)
            return std::unexpected(traceUrl.error());
        return TraceEvent { .traceId = std::move(*traceId), .traceUrl = std::move(*traceUrl) };
    }

    auto decodeClarifyingQuestions(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto const it = obj.find("questions");
        if (it == obj.end() || !it->is_array())
            return makeError(ErrorCode::ProtocolError, "Missing or invalid array field: questions");

        auto event = ClarifyingQuestionsEvent {};
        for (const auto& item: *it)
        {
            auto label = json::getString(item, "label");
            if (!label)
                return std::unexpected(label.error());
            auto question = json::getString(item, "question");
            if (!question)
                return std::unexpected(question.error());
            event.questions.push_back(
                ClarifyingQuestion { .label = std::move(*label), .question = std::move(*question) });
        }
        return event;
    }

    auto decodePrompt(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto agent = json::getString(obj, "agent");
        if (!agent)
            return std::unexpected(agent.error());
        auto sequence = json::getUnsigned<std::uint32_t>(obj, "sequence");
        if (!sequence)
            return std::unexpected(sequence.error());
        auto content = json::getString(obj, "content");
        if (!content)
            return std::unexpected(content.error());
        return PromptEvent { .agent = std::move(*agent), .sequence = *sequence, .content = std::move(*content) };
    }

    auto decodeTokenUsage(const nlohmann::json& obj) -> Result<std::optional<TokenUsage>>
    {
        auto const it = obj.find("token_usage");
        if (it == obj.end() || it->is_null())
            return std::optional<TokenUsage> {};
        if (!it->is_object())
            return makeError(ErrorCode::ProtocolError, "Invalid object field: token_usage");

        auto prompt = json::getUnsigned<std::uint32_t>(*it, "prompt_tokens");
        if (!prompt)
            return std::unexpected(prompt.error());
        auto completion = json::getUnsigned<std::uint32_t>(*it, "completion_tokens");
        if (!completion)
            return std::unexpected(completion.error());
        auto total = json::getUnsigned<std::uint32_t>(*it, "total_tokens");
        if (!total)
            return std::unexpected(total.error());
        return std::optional<TokenUsage> { TokenUsage {
            .promptTokens = *prompt,
            .completionTokens = *completion,
            .totalTokens = *total,
        } };
    }

    auto decodeAgentOutput(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto agent = json::getString(obj, "agent");
        if (!agent)
            return std::unexpected(agent.error());
        auto sequence = json::getUnsigned<std::uint32_t>(obj, "sequence");
        if (!sequence)
            return std::unexpected(sequence.error());
        auto content = json::getString(obj, "content");
        if (!content)
            return std::unexpected(content.error());
        auto usage = decodeTokenUsage(obj);
        if (!usage)
            return std::unexpected(usage.error());
        return AgentOutputEvent {
            .agent = std::move(*agent),
            .sequence = *sequence,
            .content = std::move(*content),
            .tokenUsage = *usage,
        };
    }

    auto decodeDecision(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto action = json::getString(obj, "action");
        if (!action)
            return std::unexpected(action.error());
        auto reason = json::getString(obj, "reason");
        if (!reason)
            return std::unexpected(reason.error());
        auto searches = json::getUnsigned<std::uint32_t>(obj, "remaining_searches");
        if (!searches)
            return std::unexpected(searches.error());
        auto iterations = json::getUnsigned<std::uint32_t>(obj, "remaining_iterations");
        if (!iterations)
            return std::unexpected(iterations.error());
        return DecisionEvent {
            .action = std::move(*action),
            .reason = std::move(*reason),
            .remainingSearches = *searches,
            .remainingIterations = *iterations,
        };
    }

    auto decodeReport(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto summary = json::getString(obj, "short_summary");
        if (!summary)
            return std::unexpected(summary.error());
        auto markdown = json::getString(obj, "markdown_report");
        if (!markdown)
            return std::unexpected(markdown.error());

        auto const it = obj.find("follow_up_questions");
        if (it == obj.end() || !it->is_array())
            return makeError(ErrorCode::ProtocolError, "Missing or invalid array field: follow_up_questions");

        auto event = ReportEvent { .shortSummary = std::move(*summary), .markdownReport = std::move(*markdown) };
        for (const auto& question: *it)
        {
            if (!question.is_string())
                return makeError(ErrorCode::ProtocolError, "Invalid entry in follow_up_questions");
            event.followUpQuestions.push_back(question.get<std::string>());
        }
        return event;
    }

    auto decodeMetadata(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto model = json::getString(obj, "model");
        if (!model)
            return std::unexpected(model.error());
        auto totalTokens = json::getOptionalUnsigned<std::uint32_t>(obj, "total_tokens");
        if (!totalTokens)
            return std::unexpected(totalTokens.error());
        auto duration = json::getUnsigned<std::uint64_t>(obj, "duration_ms");
        if (!duration)
            return std::unexpected(duration.error());
        return MetadataEvent { .model = std::move(*model), .totalTokens = *totalTokens, .durationMs = *duration };
    }

    auto decodeError(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto message = json::getString(obj, "message");
        if (!message)
            return std::unexpected(message.error());
        auto code = json::getOptionalString(obj, "code");
        if (!code)
            return std::unexpected(code.error());
        return ErrorEvent { .message = std::move(*message), .code = std::move(*code) };
    }

    auto decodeDone(const nlohmann::json& obj) -> Result<WorkerEvent>
    {
        auto success = json::getBool(obj, "success");
        if (!success)
            return std::unexpected(success.error());
        return DoneEvent { .success = *success };
    }

    using EventDecoder = auto (*)(const nlohmann::json&) -> Result<WorkerEvent>;

    struct DecoderEntry
    {
        std::string_view tag;
        EventDecoder decode;
    };

    constexpr auto Decoders = std::array<DecoderEntry, 10> { {
        { .tag = "status", .decode = decodeStatus },
        { .tag = "trace", .decode = decodeTrace },
        { .tag = "clarifying_questions", .decode = decodeClarifyingQuestions },
        { .tag = "prompt", .decode = decodePrompt },
        { .tag = "raw_response", .decode = decodeAgentOutput },
        { .tag = "decision", .decode = decodeDecision },
        { .tag = "report", .decode = decodeReport },
        { .tag = "metadata", .decode = decodeMetadata },
        { .tag = "error", .decode = decodeError },
        { .tag = "done", .decode = decodeDone },
    } };

    /// @brief Appends a newline so every encoded message occupies exactly one line.
    auto asLine(const nlohmann::json& message) -> std::string
    {
        return json::dump(message) + "\n";
    }

} // namespace

auto eventTypeName(const WorkerEvent& event) -> std::string_view
{
    return Decoders[event.index()].tag;
}

auto interruptCommandName(InterruptCommand command) -> std::string_view
{
    switch (command)
    {
        case InterruptCommand::Stop: return "stop";
        case InterruptCommand::Pause: return "pause";
        case InterruptCommand::ForceWrite: return "force_write";
    }
    return "stop";
}

auto parseInterruptCommand(std::string_view name) -> std::optional<InterruptCommand>
{
    if (name == "stop")
        return InterruptCommand::Stop;
    if (name == "pause")
        return InterruptCommand::Pause;
    if (name == "force_write")
        return InterruptCommand::ForceWrite;
    return std::nullopt;
}

auto toJson(const Request& request) -> nlohmann::json
{
    return nlohmann::json {
        { "version", request.version },
        { "run_id", request.runId },
        { "query", request.query },
        { "config",
          {
              { "model", request.config.model },
              { "search_count", request.config.searchCount },
              { "max_iterations", request.config.maxIterations },
              { "max_searches", request.config.maxSearches },
              { "auto_decide", request.config.autoDecide },
          } },
    };
}

auto toJson(const TokenUsage& usage) -> nlohmann::json
{
    return nlohmann::json {
        { "prompt_tokens", usage.promptTokens },
        { "completion_tokens", usage.completionTokens },
        { "total_tokens", usage.totalTokens },
    };
}

auto encodeRequest(const Request& request) -> std::string
{
    return asLine(toJson(request));
}

auto decodeRequest(std::string_view line) -> Result<Request>
{
    auto parsed = json::parse(trimLine(line));
    if (!parsed)
        return std::unexpected(parsed.error());
    auto const& root = *parsed;
    if (!root.is_object())
        return makeError(ErrorCode::ProtocolError, "Request is not a JSON object");

    auto version = json::getString(root, "version");
    if (!version)
        return std::unexpected(version.error());
    auto runId = json::getString(root, "run_id");
    if (!runId)
        return std::unexpected(runId.error());
    auto query = json::getString(root, "query");
    if (!query)
        return std::unexpected(query.error());

    auto const configIt = root.find("config");
    if (configIt == root.end() || !configIt->is_object())
        return makeError(ErrorCode::ProtocolError, "Missing or invalid object field: config");
    auto const& cfg = *configIt;

    auto model = json::getString(cfg, "model");
    if (!model)
        return std::unexpected(model.error());
    auto searchCount = json::getUnsigned<std::uint32_t>(cfg, "search_count");
    if (!searchCount)
        return std::unexpected(searchCount.error());
    auto maxIterations = json::getUnsigned<std::uint32_t>(cfg, "max_iterations");
    if (!maxIterations)
        return std::unexpected(maxIterations.error());
    auto maxSearches = json::getUnsigned<std::uint32_t>(cfg, "max_searches");
    if (!maxSearches)
        return std::unexpected(maxSearches.error());
    auto autoDecide = json::getBool(cfg, "auto_decide");
    if (!autoDecide)
        return std::unexpected(autoDecide.error());

    return Request {
        .version = std::move(*version),
        .runId = std::move(*runId),
        .query = std::move(*query),
        .config =
            RequestConfig {
                .model = std::move(*model),
                .searchCount = *searchCount,
                .maxIterations = *maxIterations,
                .maxSearches = *maxSearches,
                .autoDecide = *autoDecide,
            },
    };
}

auto encodeAnswers(const std::vector<std::string>& answers) -> std::string
{
    return asLine(nlohmann::json { { "answers", answers } });
}

auto encodeInterrupt(InterruptCommand command) -> std::string
{
    return asLine(nlohmann::json {
        { "type", "interrupt" },
        { "command", interruptCommandName(command) },
    });
}

auto decodeEvent(std::string_view line) -> Result<WorkerEvent>
{
    auto parsed = json::parse(trimLine(line));
    if (!parsed)
        return std::unexpected(parsed.error());
    auto const& root = *parsed;
    if (!root.is_object())
        return makeError(ErrorCode::ProtocolError, "Event is not a JSON object");

    auto tag = json::getString(root, "type");
    if (!tag)
        return std::unexpected(tag.error());

    for (const auto& entry: Decoders)
    {
        if (entry.tag == *tag)
            return entry.decode(root);
    }
    return makeError(ErrorCode::ProtocolError, std::format("Unknown event type: {}", *tag));
}

} // namespace lode
