// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <protocol/Messages.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lode
{

/// @brief How to launch the research worker.
struct WorkerConfig
{
    std::string command = "uv";
    std::vector<std::string> args = { "run", "python", "-m", "lode.runner" };
    std::map<std::string, std::string> env;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    RequestConfig request;
    WorkerConfig worker;

    /// @brief Directory under which every run gets its own artifact directory.
    std::string runsDir = "runs";

    /// @brief Whether to expand the log panel on startup (set via --log CLI flag).
    bool logPanelExpanded = false;
};

/// @brief Looks up an environment variable; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Environment lookup backed by the process environment.
[[nodiscard]] auto processEnvironment() -> EnvLookup;

/// @brief Loads the configuration from the default config path, or defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// Missing keys keep their defaults.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Applies LODE_* environment overrides on top of @p config.
///
/// Recognized: LODE_MODEL, LODE_SEARCH_COUNT, LODE_MAX_ITERATIONS,
/// LODE_MAX_SEARCHES, LODE_AUTO_DECIDE, LODE_RUNS_DIR. Unparseable values are
/// skipped with a warning.
void applyEnvironment(AppConfig& config, const EnvLookup& lookup);

/// @brief Splits a worker command line ("uv run python -m lode.runner") on whitespace.
/// @return The command and its arguments, or an InvalidArgument error if empty.
[[nodiscard]] auto parseWorkerCommandLine(std::string_view commandLine) -> Result<WorkerConfig>;

/// @brief Returns the default config directory path ($XDG_CONFIG_HOME/lode or ~/.config/lode).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace lode
