// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <lode/App.hpp>
#include <lode/Config.hpp>
#include <lode/ConsoleOutput.hpp>
#include <lode/SingleShot.hpp>

#include <CLI/CLI.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

int main(int argc, char** argv)
{
    auto app = CLI::App { "lode - terminal front end for a multi-agent research worker" };

    auto queryWords = std::vector<std::string> {};
    auto model = std::optional<std::string> {};
    auto searchCount = std::optional<std::uint32_t> {};
    auto maxIterations = std::optional<std::uint32_t> {};
    auto maxSearches = std::optional<std::uint32_t> {};
    auto noAutoDecide = false;
    auto jsonOutput = false;
    auto quiet = false;
    auto configPath = std::string {};
    auto runsDir = std::optional<std::string> {};
    auto workerCommand = std::optional<std::string> {};
    auto verbose = false;
    auto logLevel = std::optional<std::string> {};
    auto showLog = false;

    app.add_option("query", queryWords, "Research question; omit to start the interactive front end");
    app.add_option("--model", model, "Model the worker should use");
    app.add_option("--search-count", searchCount, "Number of searches to plan");
    app.add_option("--max-iterations", maxIterations, "Maximum research iterations");
    app.add_option("--max-searches", maxSearches, "Maximum total searches");
    app.add_flag("--no-auto-decide", noAutoDecide, "Ask for confirmation after the clarifying answers");
    app.add_flag("--json", jsonOutput, "Print one JSON object per line (single-shot mode)");
    app.add_flag("-q,--quiet", quiet, "Print only the report and errors (single-shot mode)");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--runs-dir", runsDir, "Directory for run artifacts");
    app.add_option("--worker", workerCommand, "Worker command line, e.g. \"uv run python -m lode.runner\"");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level: error, warning, info, debug or trace")
        ->check([](std::string const& value) {
            return lode::log::parseLevel(value) ? std::string {} : "unknown log level: " + value;
        });
    app.add_flag("--log", showLog, "Expand the log panel on startup");

    CLI11_PARSE(app, argc, argv);

    if (logLevel)
        lode::log::setLevel(*lode::log::parseLevel(*logLevel));
    else if (verbose)
        lode::log::setLevel(lode::log::Level::Debug);

    auto configResult = configPath.empty() ? lode::loadConfig() : lode::loadConfigFromFile(configPath);
    if (!configResult)
    {
        lode::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    lode::applyEnvironment(config, lode::processEnvironment());

    // Command-line flags win over file and environment.
    if (model)
        config.request.model = *model;
    if (searchCount)
        config.request.searchCount = *searchCount;
    if (maxIterations)
        config.request.maxIterations = *maxIterations;
    if (maxSearches)
        config.request.maxSearches = *maxSearches;
    if (noAutoDecide)
        config.request.autoDecide = false;
    if (runsDir)
        config.runsDir = *runsDir;
    if (workerCommand)
    {
        auto worker = lode::parseWorkerCommandLine(*workerCommand);
        if (!worker)
        {
            lode::log::error("Invalid --worker: {}", worker.error().message);
            return 1;
        }
        worker->env = std::move(config.worker.env);
        config.worker = std::move(*worker);
    }
    if (showLog)
        config.logPanelExpanded = true;

    auto const mode = lode::selectOutputMode(jsonOutput, quiet);
    auto const stdinIsTerminal = isatty(STDIN_FILENO) != 0;

    if (!queryWords.empty())
    {
        auto query = std::string {};
        for (auto const& word: queryWords)
        {
            if (!query.empty())
                query += ' ';
            query += word;
        }
        if (!verbose && !logLevel)
            lode::log::setLevel(lode::log::Level::Warning);
        return lode::runSingleShot(config, std::move(query), mode, stdinIsTerminal);
    }

    if (!stdinIsTerminal || mode != lode::OutputMode::Human)
    {
        auto output = lode::ConsoleOutput(mode);
        output.error("MISSING_QUERY", "query is required");
        return 1;
    }

    auto application = lode::App(std::move(config));
    if (auto initResult = application.initialize(); !initResult)
    {
        lode::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
