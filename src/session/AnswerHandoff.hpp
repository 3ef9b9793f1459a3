// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lode
{

/// @brief How a clarifying round was resolved.
enum class HandoffOutcome : std::uint8_t
{
    Answered,  ///< The user supplied one answer per question.
    Cancelled, ///< The user declined at the confirmation prompt.
    Abandoned, ///< The run ended before the round was resolved.
};

struct HandoffResult
{
    HandoffOutcome outcome = HandoffOutcome::Abandoned;
    std::vector<std::string> answers;
};

/// @brief Single-use rendezvous between the UI collecting answers and the session awaiting them.
///
/// Exactly one of fulfill(), cancel() or abandon() takes effect; later calls return false.
class AnswerHandoff
{
  public:
    AnswerHandoff() = default;

    AnswerHandoff(const AnswerHandoff&) = delete;
    AnswerHandoff& operator=(const AnswerHandoff&) = delete;

    auto fulfill(std::vector<std::string> answers) -> bool;
    auto cancel() -> bool;
    auto abandon() -> bool;

    /// @brief Waits up to @p timeout for the round to be resolved.
    /// @return The result, or nullopt if still unresolved when the timeout expires.
    [[nodiscard]] auto waitFor(std::chrono::milliseconds timeout) -> std::optional<HandoffResult>;

    [[nodiscard]] auto isResolved() const -> bool;

  private:
    auto resolve(HandoffOutcome outcome, std::vector<std::string> answers) -> bool;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::optional<HandoffResult> _result;
};

} // namespace lode
