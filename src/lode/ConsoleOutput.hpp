// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <protocol/Messages.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace lode
{

/// @brief Presentation of a single-shot run on the console.
enum class OutputMode : std::uint8_t
{
    Human, ///< Progress on stderr, report on stdout.
    Quiet, ///< Only the report and errors.
    Json,  ///< One JSON object per line on stdout.
};

/// @brief Picks the output mode from the --json and --quiet flags (JSON wins).
[[nodiscard]] auto selectOutputMode(bool json, bool quiet) -> OutputMode;

/// @brief Writes run progress for non-interactive use.
class ConsoleOutput
{
  public:
    explicit ConsoleOutput(OutputMode mode, std::FILE* out = stdout, std::FILE* err = stderr);

    [[nodiscard]] auto mode() const noexcept -> OutputMode { return _mode; }

    void start(std::string_view runId, const std::filesystem::path& artifactsDir, const RequestConfig& config);

    /// @brief Renders one worker event (status, trace, prompt, response, decision, report, error).
    void event(const WorkerEvent& event);

    void status(std::string_view message);
    void trace(std::string_view traceId, std::string_view traceUrl);
    void prompt(std::string_view agent, std::uint32_t sequence);
    void response(std::string_view agent, std::uint32_t sequence);
    void decision(std::string_view action,
                  std::string_view reason,
                  std::uint32_t remainingSearches,
                  std::uint32_t remainingIterations);
    void report(std::string_view shortSummary,
                std::string_view markdownReport,
                const std::vector<std::string>& followUpQuestions);
    void error(std::optional<std::string_view> code, std::string_view message);
    void warning(std::string_view message);
    void complete(bool success, std::string_view runId, const std::filesystem::path& artifactsDir);

  private:
    OutputMode _mode;
    std::FILE* _out;
    std::FILE* _err;
};

} // namespace lode
