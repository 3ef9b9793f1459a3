// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <protocol/Messages.hpp>

#include <session/AnswerHandoff.hpp>
#include <session/InterruptPath.hpp>
#include <session/WorkerChannel.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lode
{

/// @brief Everything scoped to one run: its id, its interrupt path and its clarifying handoff.
///
/// Created when a query is submitted and released as a unit when the run ends.
/// After release() every operation is a no-op returning false, so late UI
/// commands can never reach a worker or a handoff of a finished run.
class RunContext
{
  public:
    explicit RunContext(std::string runId);
    ~RunContext();

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    [[nodiscard]] auto runId() const -> const std::string& { return _runId; }

    /// @brief Attaches the live worker and opens the interrupt path.
    void bindWorker(WorkerChannel& worker);

    /// @brief Starts the run's clarifying round.
    /// @return The handoff to wait on, or nullptr if a round already happened or the run was released.
    [[nodiscard]] auto openClarification() -> std::shared_ptr<AnswerHandoff>;

    auto fulfillAnswers(std::vector<std::string> answers) -> bool;
    auto cancelClarification() -> bool;

    /// @brief Forwards an interrupt command to the worker. No-op when no worker is bound.
    auto sendInterrupt(InterruptCommand command) -> bool;

    /// @brief Revokes the interrupt path and abandons any pending handoff. Idempotent.
    void release();

    [[nodiscard]] auto isReleased() const -> bool;
    [[nodiscard]] auto hasClarified() const -> bool;

    /// @brief Returns true while a clarifying round is open and unresolved.
    [[nodiscard]] auto hasPendingClarification() const -> bool;

  private:
    std::string _runId;
    mutable std::mutex _mutex;
    std::shared_ptr<AnswerHandoff> _handoff;
    std::unique_ptr<InterruptPath> _interrupts;
    bool _clarificationOpened = false;
    bool _released = false;
};

} // namespace lode
