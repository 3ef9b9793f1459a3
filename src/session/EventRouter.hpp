// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <protocol/Messages.hpp>

#include <session/ArtifactSink.hpp>
#include <session/RunContext.hpp>
#include <session/WorkerChannel.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <stop_token>
#include <string_view>

namespace lode
{

/// @brief Distributes decoded worker events, one line at a time, in arrival order.
///
/// For every event the router forwards a copy to the observer, persists what is
/// persistable, blocks on the clarifying handoff when the worker asks its
/// questions, and records the final done flag.
class EventRouter
{
  public:
    /// @brief Observer receiving every decoded event on the reader thread.
    using EventCallback = std::function<void(const WorkerEvent&)>;

    /// @brief Granularity of the clarifying wait; liveness and stop are checked in between.
    static constexpr auto HandoffPollInterval = std::chrono::milliseconds(100);

    EventRouter(RunContext& context, ArtifactSink& sink, WorkerChannel& worker, EventCallback onEvent);

    /// @brief Decodes and routes one line of worker output.
    ///
    /// Malformed lines are logged once and skipped.
    /// @return An error only if the run must be aborted (SyncError or Cancelled).
    [[nodiscard]] auto handleLine(std::string_view line, std::stop_token const& stopToken) -> VoidResult;

    /// @brief Routes an already decoded event.
    [[nodiscard]] auto route(const WorkerEvent& event, std::stop_token const& stopToken) -> VoidResult;

    [[nodiscard]] auto doneSeen() const noexcept -> bool { return _doneSeen; }
    [[nodiscard]] auto doneSuccess() const noexcept -> bool { return _doneSuccess; }
    [[nodiscard]] auto reportSeen() const noexcept -> bool { return _reportSeen; }
    [[nodiscard]] auto answersSent() const noexcept -> bool { return _answersSent; }
    [[nodiscard]] auto cancelled() const noexcept -> bool { return _cancelled; }
    [[nodiscard]] auto malformedLines() const noexcept -> std::size_t { return _malformedLines; }

  private:
    void persist(const WorkerEvent& event);
    [[nodiscard]] auto awaitAnswers(const ClarifyingQuestionsEvent& event,
                                    AnswerHandoff& handoff,
                                    std::stop_token const& stopToken) -> VoidResult;
    [[nodiscard]] auto sendAnswers(const std::vector<std::string>& answers) -> VoidResult;
    void cancelRun();

    RunContext& _context;
    ArtifactSink& _sink;
    WorkerChannel& _worker;
    EventCallback _onEvent;

    bool _doneSeen = false;
    bool _doneSuccess = false;
    bool _reportSeen = false;
    bool _answersSent = false;
    bool _cancelled = false;
    std::size_t _malformedLines = 0;
};

} // namespace lode
