// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <lode/Config.hpp>
#include <lode/ConsoleOutput.hpp>

#include <protocol/Messages.hpp>

#include <session/WorkerProcess.hpp>

#include <cstdio>
#include <istream>
#include <string>
#include <vector>

namespace lode
{

/// @brief Builds the process launch description for a worker configuration.
[[nodiscard]] auto makeWorkerLaunch(const WorkerConfig& worker, StderrMode stderrMode) -> WorkerLaunch;

/// @brief Collects one answer per clarifying question.
///
/// When @p interactive is set, each question is printed to @p prompt and a
/// line is read from @p in (end of input yields empty answers). Otherwise
/// every question is answered with an empty string.
[[nodiscard]] auto collectAnswers(const std::vector<ClarifyingQuestion>& questions,
                                  std::istream& in,
                                  std::FILE* prompt,
                                  bool interactive) -> std::vector<std::string>;

/// @brief Runs one research query to completion without the terminal front end.
/// @param interactiveStdin Whether clarifying questions may be asked on stdin.
/// @return The process exit code: 0 on overall success, 1 otherwise.
[[nodiscard]] auto runSingleShot(const AppConfig& config, std::string query, OutputMode mode, bool interactiveStdin)
    -> int;

} // namespace lode
