// SPDX-License-Identifier: Apache-2.0
#include "AnswerHandoff.hpp"

namespace lode
{

auto AnswerHandoff::fulfill(std::vector<std::string> answers) -> bool
{
    return resolve(HandoffOutcome::Answered, std::move(answers));
}

auto AnswerHandoff::cancel() -> bool
{
    return resolve(HandoffOutcome::Cancelled, {});
}

auto AnswerHandoff::abandon() -> bool
{
    return resolve(HandoffOutcome::Abandoned, {});
}

auto AnswerHandoff::resolve(HandoffOutcome outcome, std::vector<std::string> answers) -> bool
{
    {
        auto const lock = std::lock_guard(_mutex);
        if (_result)
            return false;
        _result = HandoffResult { .outcome = outcome, .answers = std::move(answers) };
    }
    _cv.notify_all();
    return true;
}

auto AnswerHandoff::waitFor(std::chrono::milliseconds timeout) -> std::optional<HandoffResult>
{
    auto lock = std::unique_lock(_mutex);
    if (!_cv.wait_for(lock, timeout, [this] { return _result.has_value(); }))
        return std::nullopt;
    return _result;
}

auto AnswerHandoff::isResolved() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _result.has_value();
}

} // namespace lode
