// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lode
{

/// @brief Protocol version string carried by every session request.
constexpr auto ProtocolVersion = std::string_view { "v1" };

/// @brief Research parameters sent to the worker with each request.
struct RequestConfig
{
    std::string model = "gpt-4o";
    std::uint32_t searchCount = 5;
    std::uint32_t maxIterations = 10;
    std::uint32_t maxSearches = 15;
    bool autoDecide = true;

    auto operator==(const RequestConfig&) const -> bool = default;
};

/// @brief Outbound session initiation message, written once per run before anything else.
struct Request
{
    std::string version = std::string(ProtocolVersion);
    std::string runId;
    std::string query;
    RequestConfig config;

    auto operator==(const Request&) const -> bool = default;
};

/// @brief A clarifying question asked by the worker before research starts.
struct ClarifyingQuestion
{
    std::string label;
    std::string question;
};

/// @brief Token accounting attached to an agent output.
struct TokenUsage
{
    std::uint32_t promptTokens = 0;
    std::uint32_t completionTokens = 0;
    std::uint32_t totalTokens = 0;
};

/// @brief Advisory control commands that can be sent to a running worker.
enum class InterruptCommand : std::uint8_t
{
    Stop,
    Pause,
    ForceWrite,
};

// --- Inbound worker events ---

struct StatusEvent
{
    std::string message;
};

struct TraceEvent
{
    std::string traceId;
    std::string traceUrl;
};

struct ClarifyingQuestionsEvent
{
    std::vector<ClarifyingQuestion> questions;
};

struct PromptEvent
{
    std::string agent;
    std::uint32_t sequence = 0;
    std::string content;
};

/// @brief Raw output of one agent step (wire tag "raw_response").
struct AgentOutputEvent
{
    std::string agent;
    std::uint32_t sequence = 0;
    std::string content;
    std::optional<TokenUsage> tokenUsage;
};

struct DecisionEvent
{
    std::string action;
    std::string reason;
    std::uint32_t remainingSearches = 0;
    std::uint32_t remainingIterations = 0;
};

struct ReportEvent
{
    std::string shortSummary;
    std::string markdownReport;
    std::vector<std::string> followUpQuestions;
};

struct MetadataEvent
{
    std::string model;
    std::optional<std::uint32_t> totalTokens;
    std::uint64_t durationMs = 0;
};

struct ErrorEvent
{
    std::string message;
    std::optional<std::string> code;
};

struct DoneEvent
{
    bool success = false;
};

/// @brief Closed set of messages a worker can emit, discriminated by the "type" field.
using WorkerEvent = std::variant<StatusEvent,
                                 TraceEvent,
                                 ClarifyingQuestionsEvent,
                                 PromptEvent,
                                 AgentOutputEvent,
                                 DecisionEvent,
                                 ReportEvent,
                                 MetadataEvent,
                                 ErrorEvent,
                                 DoneEvent>;

/// @brief Returns the wire tag of an event ("status", "raw_response", ...).
[[nodiscard]] auto eventTypeName(const WorkerEvent& event) -> std::string_view;

/// @brief Returns the wire name of an interrupt command ("stop", "pause", "force_write").
[[nodiscard]] auto interruptCommandName(InterruptCommand command) -> std::string_view;

/// @brief Parses an interrupt command from its wire name.
[[nodiscard]] auto parseInterruptCommand(std::string_view name) -> std::optional<InterruptCommand>;

/// @brief Converts a request into its JSON object form.
[[nodiscard]] auto toJson(const Request& request) -> nlohmann::json;

/// @brief Converts token usage into its JSON object form.
[[nodiscard]] auto toJson(const TokenUsage& usage) -> nlohmann::json;

/// @brief Serializes a request as one newline-terminated line.
[[nodiscard]] auto encodeRequest(const Request& request) -> std::string;

/// @brief Decodes a request line (as written by encodeRequest).
/// @return The request or a ProtocolError.
[[nodiscard]] auto decodeRequest(std::string_view line) -> Result<Request>;

/// @brief Serializes the answers of a clarifying round as one newline-terminated line.
[[nodiscard]] auto encodeAnswers(const std::vector<std::string>& answers) -> std::string;

/// @brief Serializes an interrupt command as one newline-terminated line.
[[nodiscard]] auto encodeInterrupt(InterruptCommand command) -> std::string;

/// @brief Decodes one line of worker output.
///
/// Trailing carriage returns and surrounding whitespace are ignored.
/// @return The event, or a ProtocolError for malformed JSON, a missing or unknown
///         "type" tag, or fields that do not match the variant's schema.
[[nodiscard]] auto decodeEvent(std::string_view line) -> Result<WorkerEvent>;

} // namespace lode
