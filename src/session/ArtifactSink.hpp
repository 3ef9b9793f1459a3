// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <protocol/Messages.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace lode
{

/// @brief Persists everything exchanged during one run under `<runsRoot>/<runId>/`.
///
/// Layout:
///   request.json
///   prompts/NNN-<agent>.txt
///   raw_responses/NNN-<agent>.json
///   output.md        (only if a report was received)
///   metadata.json    (written by finalize())
///
/// All writes report PersistenceError on failure; callers treat them as warnings.
class ArtifactSink
{
  public:
    ArtifactSink(std::filesystem::path runsRoot, std::string runId);

    /// @brief Creates the run directory and its subdirectories.
    [[nodiscard]] auto prepare() -> VoidResult;

    [[nodiscard]] auto writeRequest(const Request& request) -> VoidResult;
    [[nodiscard]] auto writePrompt(const PromptEvent& prompt) -> VoidResult;
    [[nodiscard]] auto writeAgentOutput(const AgentOutputEvent& output) -> VoidResult;
    [[nodiscard]] auto writeReport(const ReportEvent& report) -> VoidResult;

    /// @brief Remembers trace links for metadata.json.
    void noteTrace(const TraceEvent& trace);

    /// @brief Remembers model and token totals for metadata.json.
    void noteMetadata(const MetadataEvent& metadata);

    /// @brief Writes metadata.json with the elapsed time since construction.
    [[nodiscard]] auto finalize() -> VoidResult;

    [[nodiscard]] auto runDir() const -> const std::filesystem::path& { return _runDir; }

    /// @brief Returns "NNN-<agent>" as used for prompt and response file names.
    [[nodiscard]] static auto artifactStem(std::uint32_t sequence, std::string_view agent) -> std::string;

  private:
    std::string _runId;
    std::filesystem::path _runDir;
    std::chrono::steady_clock::time_point _startedAt;

    std::optional<std::string> _model;
    std::optional<std::uint32_t> _totalTokens;
    std::optional<std::string> _traceId;
    std::optional<std::string> _traceUrl;
};

} // namespace lode
