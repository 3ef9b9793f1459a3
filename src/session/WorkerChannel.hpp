// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace lode
{

/// @brief Abstract line-oriented duplex connection to a worker process.
///
/// Writes may come from several threads and must not interleave mid-line.
/// Reads are performed by a single reader thread.
class WorkerChannel
{
  public:
    virtual ~WorkerChannel() = default;

    /// @brief Writes one complete line (including its trailing newline) to the worker's input.
    [[nodiscard]] virtual auto writeLine(std::string_view line) -> VoidResult = 0;

    /// @brief Blocks until the next line of worker output is available.
    /// @return The line without its newline, nullopt at end of stream, or
    ///         a Cancelled error once @p stopToken is triggered.
    [[nodiscard]] virtual auto readLine(std::stop_token const& stopToken)
        -> Result<std::optional<std::string>> = 0;

    /// @brief Signals end-of-input to the worker. Further writes fail.
    virtual void closeInput() = 0;

    /// @brief Returns true while the worker process has not exited.
    [[nodiscard]] virtual auto isRunning() -> bool = 0;

    /// @brief Waits for the worker to exit.
    /// @return True if the worker exited with status zero.
    [[nodiscard]] virtual auto wait() -> Result<bool> = 0;

    /// @brief Terminates the worker if it is still running.
    virtual void terminate() = 0;
};

} // namespace lode
