// SPDX-License-Identifier: Apache-2.0
#include "InterruptPath.hpp"

#include <core/Log.hpp>

namespace lode
{

InterruptPath::InterruptPath(WorkerChannel& worker): _worker(worker)
{
    _forwarder = std::jthread([this](std::stop_token const& token) { run(token); });
}

InterruptPath::~InterruptPath()
{
    close();
}

auto InterruptPath::send(InterruptCommand command) -> bool
{
    return _commands.send(command);
}

void InterruptPath::close()
{
    if (!_forwarder.joinable())
        return;
    _forwarder.request_stop();
    _commands.close();
    _forwarder.join();
}

void InterruptPath::run(std::stop_token const& stopToken)
{
    while (auto command = _commands.receive(stopToken))
    {
        log::debug("Forwarding interrupt: {}", interruptCommandName(*command));
        if (auto result = _worker.writeLine(encodeInterrupt(*command)); !result)
            log::warning("failed to send interrupt: {}", result.error().message);
    }
}

} // namespace lode
