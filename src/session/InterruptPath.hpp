// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>

#include <protocol/Messages.hpp>

#include <session/WorkerChannel.hpp>

#include <thread>

namespace lode
{

/// @brief Per-run forwarder delivering interrupt commands to the worker's input.
///
/// A dedicated thread consumes queued commands and writes them as interrupt
/// lines. Once closed, send() is a no-op, so no command can reach a worker
/// that belongs to a finished run.
class InterruptPath
{
  public:
    explicit InterruptPath(WorkerChannel& worker);
    ~InterruptPath();

    InterruptPath(const InterruptPath&) = delete;
    InterruptPath& operator=(const InterruptPath&) = delete;

    /// @brief Queues a command for delivery.
    /// @return False if the path is already closed.
    auto send(InterruptCommand command) -> bool;

    /// @brief Revokes the path and joins the forwarder thread. Idempotent.
    void close();

    [[nodiscard]] auto isOpen() const -> bool { return !_commands.isClosed(); }

  private:
    void run(std::stop_token const& stopToken);

    WorkerChannel& _worker;
    Channel<InterruptCommand> _commands;
    std::jthread _forwarder;
};

} // namespace lode
