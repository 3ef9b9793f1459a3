// SPDX-License-Identifier: Apache-2.0
#include "RunContext.hpp"

#include <core/Log.hpp>
#include <core/RunId.hpp>

#include <utility>

namespace lode
{

RunContext::RunContext(std::string runId): _runId(std::move(runId))
{
}

RunContext::~RunContext()
{
    release();
}

void RunContext::bindWorker(WorkerChannel& worker)
{
    auto const lock = std::lock_guard(_mutex);
    if (_released || _interrupts)
        return;
    _interrupts = std::make_unique<InterruptPath>(worker);
}

auto RunContext::openClarification() -> std::shared_ptr<AnswerHandoff>
{
    auto const lock = std::lock_guard(_mutex);
    if (_released || _clarificationOpened)
        return nullptr;
    _clarificationOpened = true;
    _handoff = std::make_shared<AnswerHandoff>();
    return _handoff;
}

auto RunContext::fulfillAnswers(std::vector<std::string> answers) -> bool
{
    auto const lock = std::lock_guard(_mutex);
    if (!_handoff)
        return false;
    auto handoff = std::exchange(_handoff, nullptr);
    return handoff->fulfill(std::move(answers));
}

auto RunContext::cancelClarification() -> bool
{
    auto const lock = std::lock_guard(_mutex);
    if (!_handoff)
        return false;
    auto handoff = std::exchange(_handoff, nullptr);
    return handoff->cancel();
}

auto RunContext::sendInterrupt(InterruptCommand command) -> bool
{
    auto const lock = std::lock_guard(_mutex);
    if (!_interrupts)
    {
        log::debug("Interrupt {} dropped: run {} has no live worker", interruptCommandName(command), shortRunId(_runId));
        return false;
    }
    return _interrupts->send(command);
}

void RunContext::release()
{
    auto interrupts = std::unique_ptr<InterruptPath> {};
    auto handoff = std::shared_ptr<AnswerHandoff> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (_released)
            return;
        _released = true;
        interrupts = std::move(_interrupts);
        handoff = std::exchange(_handoff, nullptr);
    }

    // Must not hold _mutex while joining the forwarder.
    if (interrupts)
        interrupts->close();
    if (handoff)
        handoff->abandon();
}

auto RunContext::isReleased() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _released;
}

auto RunContext::hasClarified() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _clarificationOpened;
}

auto RunContext::hasPendingClarification() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _handoff && !_handoff->isResolved();
}

} // namespace lode
