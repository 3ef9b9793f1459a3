// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>

namespace lode
{

namespace
{
    auto parseUint(std::string_view text) -> std::optional<std::uint32_t>
    {
        auto value = std::uint32_t { 0 };
        auto const* const end = text.data() + text.size();
        auto const [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc {} || ptr != end || text.empty())
            return std::nullopt;
        return value;
    }

    auto parseBool(std::string_view text) -> std::optional<bool>
    {
        auto lowered = std::string(text);
        std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });
        if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on")
            return true;
        if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off")
            return false;
        return std::nullopt;
    }

    void overrideUint(const EnvLookup& lookup, std::string_view name, std::uint32_t& target)
    {
        auto const value = lookup(name);
        if (!value)
            return;
        if (auto parsed = parseUint(*value))
            target = *parsed;
        else
            log::warning("Ignoring {}: '{}' is not an unsigned integer", name, *value);
    }

} // namespace

auto processEnvironment() -> EnvLookup
{
    return [](std::string_view name) -> std::optional<std::string> {
        auto const* const value = std::getenv(std::string(name).c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    };
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/lode";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/lode";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: top-level value must be an object", path));

    auto config = AppConfig {};
    auto const defaults = AppConfig {};

    // Research section
    if (auto const it = root.find("research"); it != root.end() && it->is_object())
    {
        auto const& research = *it;
        config.request.model = json::getStringOr(research, "model", defaults.request.model);
        config.request.searchCount = json::getUintOr(research, "searchCount", defaults.request.searchCount);
        config.request.maxIterations = json::getUintOr(research, "maxIterations", defaults.request.maxIterations);
        config.request.maxSearches = json::getUintOr(research, "maxSearches", defaults.request.maxSearches);
        config.request.autoDecide = json::getBoolOr(research, "autoDecide", defaults.request.autoDecide);
    }

    // Worker section
    if (auto const it = root.find("worker"); it != root.end() && it->is_object())
    {
        auto const& worker = *it;
        config.worker.command = json::getStringOr(worker, "command", defaults.worker.command);

        if (auto const args = worker.find("args"); args != worker.end() && args->is_array())
        {
            config.worker.args.clear();
            for (const auto& arg: *args)
            {
                if (arg.is_string())
                    config.worker.args.push_back(arg.get<std::string>());
            }
        }

        if (auto const env = worker.find("env"); env != worker.end() && env->is_object())
        {
            for (const auto& [key, value]: env->items())
            {
                if (value.is_string())
                    config.worker.env[key] = value.get<std::string>();
            }
        }
    }

    config.runsDir = json::getStringOr(root, "runsDir", defaults.runsDir);

    // UI section
    if (auto const it = root.find("ui"); it != root.end() && it->is_object())
        config.logPanelExpanded = json::getBoolOr(*it, "logPanelExpanded", defaults.logPanelExpanded);

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto research = nlohmann::json::object();
    research["model"] = config.request.model;
    research["searchCount"] = config.request.searchCount;
    research["maxIterations"] = config.request.maxIterations;
    research["maxSearches"] = config.request.maxSearches;
    research["autoDecide"] = config.request.autoDecide;
    root["research"] = std::move(research);

    auto worker = nlohmann::json::object();
    worker["command"] = config.worker.command;
    worker["args"] = config.worker.args;
    if (!config.worker.env.empty())
        worker["env"] = config.worker.env;
    root["worker"] = std::move(worker);

    root["runsDir"] = config.runsDir;
    root["ui"] = nlohmann::json { { "logPanelExpanded", config.logPanelExpanded } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << json::dump(root, 4) << '\n';
    if (!file)
        return makeError(ErrorCode::ConfigError, std::format("Failed writing config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

void applyEnvironment(AppConfig& config, const EnvLookup& lookup)
{
    if (auto model = lookup("LODE_MODEL"); model && !model->empty())
        config.request.model = std::move(*model);

    overrideUint(lookup, "LODE_SEARCH_COUNT", config.request.searchCount);
    overrideUint(lookup, "LODE_MAX_ITERATIONS", config.request.maxIterations);
    overrideUint(lookup, "LODE_MAX_SEARCHES", config.request.maxSearches);

    if (auto const autoDecide = lookup("LODE_AUTO_DECIDE"))
    {
        if (auto parsed = parseBool(*autoDecide))
            config.request.autoDecide = *parsed;
        else
            log::warning("Ignoring LODE_AUTO_DECIDE: '{}' is not a boolean", *autoDecide);
    }

    if (auto runsDir = lookup("LODE_RUNS_DIR"); runsDir && !runsDir->empty())
        config.runsDir = std::move(*runsDir);
}

auto parseWorkerCommandLine(std::string_view commandLine) -> Result<WorkerConfig>
{
    auto words = std::vector<std::string> {};
    auto stream = std::istringstream { std::string(commandLine) };
    for (auto word = std::string {}; stream >> word;)
        words.push_back(std::move(word));

    if (words.empty())
        return makeError(ErrorCode::InvalidArgument, "Worker command must not be empty");

    auto worker = WorkerConfig { .command = std::move(words.front()), .args = {}, .env = {} };
    worker.args.assign(std::make_move_iterator(words.begin() + 1), std::make_move_iterator(words.end()));
    return worker;
}

} // namespace lode
