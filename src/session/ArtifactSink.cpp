// SPDX-License-Identifier: Apache-2.0
#include "ArtifactSink.hpp"

#include <core/JsonUtils.hpp>

#include <cctype>
#include <format>
#include <fstream>

namespace lode
{

namespace
{
    constexpr auto PromptsDir = std::string_view { "prompts" };
    constexpr auto ResponsesDir = std::string_view { "raw_responses" };

    auto writeFile(const std::filesystem::path& path, std::string_view content) -> VoidResult
    {
        auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::PersistenceError, std::format("Cannot write {}", path.string()));

        file << content;
        file.flush();
        if (!file)
            return makeError(ErrorCode::PersistenceError, std::format("Failed writing {}", path.string()));
        return {};
    }

    template <typename T>
    auto optionalToJson(const std::optional<T>& value) -> nlohmann::json
    {
        if (!value)
            return nullptr;
        return *value;
    }
} // namespace

ArtifactSink::ArtifactSink(std::filesystem::path runsRoot, std::string runId):
    _runId(std::move(runId)), _runDir(std::move(runsRoot) / _runId), _startedAt(std::chrono::steady_clock::now())
{
}

auto ArtifactSink::prepare() -> VoidResult
{
    for (auto const& dir: { _runDir, _runDir / PromptsDir, _runDir / ResponsesDir })
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::PersistenceError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
    }
    return {};
}

auto ArtifactSink::artifactStem(std::uint32_t sequence, std::string_view agent) -> std::string
{
    auto name = std::string {};
    name.reserve(agent.size());
    for (auto const ch: agent)
    {
        if (ch == '/' || ch == '\\')
            name += '_';
        else
            name += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return std::format("{:03}-{}", sequence, name);
}

auto ArtifactSink::writeRequest(const Request& request) -> VoidResult
{
    return writeFile(_runDir / "request.json", json::dump(toJson(request), 2));
}

auto ArtifactSink::writePrompt(const PromptEvent& prompt) -> VoidResult
{
    auto const path = _runDir / PromptsDir / (artifactStem(prompt.sequence, prompt.agent) + ".txt");
    return writeFile(path, prompt.content);
}

auto ArtifactSink::writeAgentOutput(const AgentOutputEvent& output) -> VoidResult
{
    auto root = nlohmann::json {
        { "agent", output.agent },
        { "sequence", output.sequence },
        { "content", output.content },
    };
    if (output.tokenUsage)
        root["token_usage"] = toJson(*output.tokenUsage);

    auto const path = _runDir / ResponsesDir / (artifactStem(output.sequence, output.agent) + ".json");
    return writeFile(path, json::dump(root, 2));
}

auto ArtifactSink::writeReport(const ReportEvent& report) -> VoidResult
{
    return writeFile(_runDir / "output.md", report.markdownReport);
}

void ArtifactSink::noteTrace(const TraceEvent& trace)
{
    _traceId = trace.traceId;
    _traceUrl = trace.traceUrl;
}

void ArtifactSink::noteMetadata(const MetadataEvent& metadata)
{
    _model = metadata.model;
    _totalTokens = metadata.totalTokens;
}

auto ArtifactSink::finalize() -> VoidResult
{
    auto const elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - _startedAt);

    auto const root = nlohmann::json {
        { "run_id", _runId },
        { "model", optionalToJson(_model) },
        { "total_tokens", optionalToJson(_totalTokens) },
        { "duration_ms", elapsed.count() },
        { "trace_id", optionalToJson(_traceId) },
        { "trace_url", optionalToJson(_traceUrl) },
    };
    return writeFile(_runDir / "metadata.json", json::dump(root, 2));
}

} // namespace lode
