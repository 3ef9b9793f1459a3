// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <protocol/Messages.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lode
{

// --- Orchestrator -> Controller ---

struct RunStarted
{
    std::string runId;
    std::filesystem::path runDir;
};

/// @brief A decoded worker event, tagged with the run that produced it.
struct WorkerEventNotice
{
    std::string runId;
    WorkerEvent event;
};

struct RunFinished
{
    std::string runId;
    bool success = false;
    bool cancelled = false;
    std::optional<Error> failure; ///< Launch or synchronization failure that aborted the run.
};

using SessionEvent = std::variant<RunStarted, WorkerEventNotice, RunFinished>;

// --- Controller -> Orchestrator ---

struct SubmitQuery
{
    std::string query;
};

struct SubmitAnswers
{
    std::string runId;
    std::vector<std::string> answers;
};

struct CancelClarification
{
    std::string runId;
};

struct SendInterrupt
{
    std::string runId;
    InterruptCommand command = InterruptCommand::Stop;
};

using SessionCommand = std::variant<SubmitQuery, SubmitAnswers, CancelClarification, SendInterrupt>;

} // namespace lode
