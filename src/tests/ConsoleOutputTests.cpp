// SPDX-License-Identifier: Apache-2.0
#include <lode/ConsoleOutput.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <sstream>
#include <string>

using namespace lode;

namespace
{

/// Temporary FILE* whose contents can be read back.
class CapturedFile
{
  public:
    CapturedFile(): _file(std::tmpfile()) {}
    ~CapturedFile()
    {
        if (_file)
            std::fclose(_file);
    }

    CapturedFile(const CapturedFile&) = delete;
    CapturedFile& operator=(const CapturedFile&) = delete;

    [[nodiscard]] auto get() const -> std::FILE* { return _file; }

    [[nodiscard]] auto contents() const -> std::string
    {
        std::fflush(_file);
        std::rewind(_file);
        auto text = std::string {};
        auto buffer = std::array<char, 512> {};
        while (auto const n = std::fread(buffer.data(), 1, buffer.size(), _file))
            text.append(buffer.data(), n);
        return text;
    }

    [[nodiscard]] auto lines() const -> std::vector<std::string>
    {
        auto result = std::vector<std::string> {};
        auto stream = std::istringstream { contents() };
        for (auto line = std::string {}; std::getline(stream, line);)
            result.push_back(line);
        return result;
    }

  private:
    std::FILE* _file;
};

} // namespace

TEST_CASE("selectOutputMode gives JSON precedence", "[console]")
{
    CHECK(selectOutputMode(false, false) == OutputMode::Human);
    CHECK(selectOutputMode(false, true) == OutputMode::Quiet);
    CHECK(selectOutputMode(true, true) == OutputMode::Json);
}

TEST_CASE("ConsoleOutput JSON mode writes one object per line", "[console]")
{
    auto const out = CapturedFile {};
    auto const err = CapturedFile {};
    REQUIRE(out.get() != nullptr);
    REQUIRE(err.get() != nullptr);

    auto console = ConsoleOutput(OutputMode::Json, out.get(), err.get());
    console.start("run-1", "runs/run-1", RequestConfig {});
    console.event(StatusEvent { .message = "Searching" });
    console.event(ReportEvent { .shortSummary = "S", .markdownReport = "# R\nline two", .followUpQuestions = {} });
    console.complete(true, "run-1", "runs/run-1");

    auto const lines = out.lines();
    REQUIRE(lines.size() == 4);
    auto const start = nlohmann::json::parse(lines[0]);
    CHECK(start["type"] == "start");
    CHECK(start["version"] == "v1");
    CHECK(start["run_id"] == "run-1");
    CHECK(nlohmann::json::parse(lines[1])["message"] == "Searching");
    CHECK(nlohmann::json::parse(lines[2])["markdown_report"] == "# R\nline two");
    auto const complete = nlohmann::json::parse(lines[3]);
    CHECK(complete["type"] == "complete");
    CHECK(complete["success"] == true);

    CHECK(err.contents().empty());
}

TEST_CASE("ConsoleOutput JSON errors carry the optional code", "[console]")
{
    auto const out = CapturedFile {};
    auto const err = CapturedFile {};
    auto console = ConsoleOutput(OutputMode::Json, out.get(), err.get());
    console.error("MISSING_QUERY", "query is required");
    console.error(std::nullopt, "plain");

    auto const lines = out.lines();
    REQUIRE(lines.size() == 2);
    auto const withCode = nlohmann::json::parse(lines[0]);
    CHECK(withCode["code"] == "MISSING_QUERY");
    CHECK(withCode["message"] == "query is required");
    CHECK(!nlohmann::json::parse(lines[1]).contains("code"));
}

TEST_CASE("ConsoleOutput human mode separates progress and report", "[console]")
{
    auto const out = CapturedFile {};
    auto const err = CapturedFile {};
    auto console = ConsoleOutput(OutputMode::Human, out.get(), err.get());
    console.status("Planning");
    console.report("Summary", "# Body", { "Why?" });
    console.error("WORKER_ERROR", "boom");

    auto const progress = err.contents();
    CHECK(progress.find("-> Planning") != std::string::npos);
    CHECK(progress.find("Error [WORKER_ERROR]: boom") != std::string::npos);

    auto const report = out.contents();
    CHECK(report.find("SUMMARY: Summary") != std::string::npos);
    CHECK(report.find("# Body") != std::string::npos);
    CHECK(report.find("  - Why?") != std::string::npos);
}

TEST_CASE("ConsoleOutput quiet mode prints only the report and errors", "[console]")
{
    auto const out = CapturedFile {};
    auto const err = CapturedFile {};
    auto console = ConsoleOutput(OutputMode::Quiet, out.get(), err.get());
    console.status("Planning");
    console.decision("search", "reason", 1, 2);
    console.warning("ignored");
    CHECK(out.contents().empty());
    CHECK(err.contents().empty());

    console.report("Summary", "# Body", {});
    console.error(std::nullopt, "failed");
    CHECK(out.contents().find("# Body") != std::string::npos);
    CHECK(err.contents().find("Error: failed") != std::string::npos);
}
