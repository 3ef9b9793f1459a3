// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <protocol/Messages.hpp>

#include <session/SessionEvents.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lode
{

/// @brief Interaction state of the front end.
enum class Phase : std::uint8_t
{
    Idle,
    AwaitingClarification,
    Clarifying,
    Confirming,
    Researching,
    Completed,
    Error,
};

/// @brief Returns a short lower-case label for a phase ("researching", ...).
[[nodiscard]] auto phaseName(Phase phase) -> std::string_view;

enum class MessageRole : std::uint8_t
{
    User,
    Assistant,
    System,
};

/// @brief One entry of the transcript.
struct ChatMessage
{
    MessageRole role = MessageRole::System;
    std::string text;
};

/// @brief What the caller should do after a submitted line.
enum class SubmitResult : std::uint8_t
{
    Accepted, ///< The line was consumed (query, answer, confirmation or command).
    Ignored,  ///< The line was rejected in the current state; nothing changed.
    Quit,     ///< The user asked to leave the program.
};

/// @brief Terminal-independent model of the interactive front end.
///
/// Owns the phase state machine and the transcript. User input arrives via
/// submitLine() and requestStop(); session progress via apply(). Work for the
/// background is emitted as SessionCommand values through the command sink.
/// Not thread-safe: all calls happen on the UI thread.
class Controller
{
  public:
    /// @brief Receives outbound commands. Returns false if the command could not be queued.
    using CommandSink = std::function<bool(SessionCommand)>;

    Controller(bool autoDecide, CommandSink sink);

    /// @brief Handles one line of input (Enter).
    auto submitLine(std::string_view line) -> SubmitResult;

    /// @brief Handles the escape key: stops the active run or declines the pending round.
    /// @return True if anything was sent.
    auto requestStop() -> bool;

    /// @brief Applies one session event.
    void apply(const SessionEvent& event);

    [[nodiscard]] auto phase() const noexcept -> Phase { return _phase; }
    [[nodiscard]] auto isProcessing() const noexcept -> bool { return _processing; }
    [[nodiscard]] auto autoDecide() const noexcept -> bool { return _autoDecide; }
    [[nodiscard]] auto messages() const noexcept -> const std::vector<ChatMessage>& { return _messages; }
    [[nodiscard]] auto statusLine() const noexcept -> const std::optional<std::string>& { return _status; }
    [[nodiscard]] auto runId() const noexcept -> const std::string& { return _runId; }
    [[nodiscard]] auto runDir() const noexcept -> const std::filesystem::path& { return _runDir; }

    /// @brief Answers collected so far in the current clarifying round.
    [[nodiscard]] auto pendingAnswers() const noexcept -> const std::vector<std::string>& { return _answers; }

    /// @brief The question currently being asked, if clarifying.
    [[nodiscard]] auto currentQuestion() const -> const ClarifyingQuestion*;

    /// @brief Title of the input box: the question label, "Confirm", or "Query".
    [[nodiscard]] auto inputTitle() const -> std::string;

    /// @brief Whether the input line currently accepts text.
    [[nodiscard]] auto inputEnabled() const noexcept -> bool;

    /// @brief Monotonic counter bumped on every visible change.
    [[nodiscard]] auto revision() const noexcept -> std::uint64_t { return _revision; }

    static constexpr auto HelpText = std::string_view {
        "Type a research question and press Enter.\n"
        "Esc stops a running research, Ctrl+L toggles logs, Up/Down/PgUp/PgDn scroll.\n"
        "Commands: /help, /quit"
    };

  private:
    auto submitQuery(std::string_view line) -> SubmitResult;
    auto submitAnswer(std::string_view line) -> SubmitResult;
    auto submitConfirmation(std::string_view line) -> SubmitResult;

    void applyWorkerEvent(const WorkerEvent& event);
    void applyRunFinished(const RunFinished& finished);

    void beginClarifying(const ClarifyingQuestionsEvent& event);
    void askCurrentQuestion();
    void forwardAnswers();
    void cancelRound();
    void enterResearching();
    auto sendStop() -> bool;

    void addMessage(MessageRole role, std::string text);
    void setStatus(std::optional<std::string> status);
    auto send(SessionCommand command) -> bool;

    bool _autoDecide;
    CommandSink _sink;

    Phase _phase = Phase::Idle;
    bool _processing = false;
    bool _stopPending = false; ///< Esc arrived before RunStarted.
    std::string _runId;
    std::filesystem::path _runDir;

    std::vector<ChatMessage> _messages;
    std::optional<std::string> _status;

    bool _roundSeen = false;
    std::vector<ClarifyingQuestion> _questions;
    std::size_t _questionIndex = 0;
    std::vector<std::string> _answers;

    std::uint64_t _revision = 0;
};

/// @brief Classification of a line typed at the confirmation prompt.
enum class ConfirmationReply : std::uint8_t
{
    Confirm,
    Cancel,
    Unrecognized,
};

/// @brief Normalizes (trim, lower-case) and classifies a confirmation reply.
[[nodiscard]] auto classifyConfirmation(std::string_view line) -> ConfirmationReply;

} // namespace lode
