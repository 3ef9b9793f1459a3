// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace lode
{

/// @brief Generates a random version-4 UUID string, e.g. "3f2b8c1e-9d4a-4c7e-8b1f-0a2d3e4f5a6b".
[[nodiscard]] auto generateRunId() -> std::string;

/// @brief Returns the first eight characters of a run id for compact display.
[[nodiscard]] auto shortRunId(std::string_view runId) -> std::string_view;

} // namespace lode
