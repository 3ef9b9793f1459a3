// SPDX-License-Identifier: Apache-2.0
#include <core/RunId.hpp>
#include <session/SessionRunner.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

using namespace lode;

#ifndef _WIN32
namespace
{

struct TempDir
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / ("lode_runner_" + generateRunId());

    TempDir() { std::filesystem::create_directories(path); }
    ~TempDir()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(path, ec);
    }
};

auto scriptedWorker(std::string script) -> WorkerLaunch
{
    return WorkerLaunch {
        .command = "/bin/sh",
        .args = { "-c", std::move(script) },
        .env = {},
        .stderrMode = StderrMode::Discard,
    };
}

auto makeRequest(std::string query) -> Request
{
    return Request { .runId = generateRunId(), .query = std::move(query) };
}

auto listFiles(const std::filesystem::path& root) -> std::set<std::string>
{
    auto files = std::set<std::string> {};
    for (auto const& entry: std::filesystem::recursive_directory_iterator(root))
    {
        if (entry.is_regular_file())
            files.insert(std::filesystem::relative(entry.path(), root).generic_string());
    }
    return files;
}

auto readFile(const std::filesystem::path& path) -> std::string
{
    auto file = std::ifstream(path);
    auto buffer = std::stringstream {};
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

TEST_CASE("SessionRunner runs a complete research session", "[runner]")
{
    auto const temp = TempDir {};
    auto const script = std::string(R"(read -r request
echo '{"type":"status","message":"Planning searches..."}'
echo '{"type":"trace","trace_id":"t-1","trace_url":"https://example.test/t-1"}'
echo '{"type":"prompt","agent":"X","sequence":1,"content":"plan"}'
echo '{"type":"raw_response","agent":"X","sequence":1,"content":"{}"}'
echo '{"type":"report","short_summary":"Qubits","markdown_report":"# Quantum computing","follow_up_questions":["Next?"]}'
echo '{"type":"metadata","model":"gpt-4o","total_tokens":42,"duration_ms":1000}'
echo '{"type":"done","success":true}'
)");

    auto runner = SessionRunner(scriptedWorker(script), temp.path);
    auto request = makeRequest("History of quantum computing");
    auto context = RunContext(request.runId);

    auto seen = std::vector<std::string> {};
    auto source = std::stop_source {};
    auto const outcome = runner.run(
        request, context, [&](const WorkerEvent& event) { seen.emplace_back(eventTypeName(event)); }, source.get_token());

    CHECK(outcome.success);
    CHECK(outcome.doneSeen);
    CHECK(outcome.doneSuccess);
    CHECK(outcome.exitSuccess);
    CHECK(outcome.reportSeen);
    CHECK(!outcome.cancelled);
    CHECK(!outcome.failure.has_value());
    CHECK(context.isReleased());
    CHECK(seen
          == std::vector<std::string> { "status", "trace", "prompt", "raw_response", "report", "metadata", "done" });

    CHECK(outcome.runDir == temp.path / request.runId);
    CHECK(listFiles(outcome.runDir)
          == std::set<std::string> {
              "request.json",
              "prompts/001-x.txt",
              "raw_responses/001-x.json",
              "output.md",
              "metadata.json",
          });
    CHECK(readFile(outcome.runDir / "output.md") == "# Quantum computing");
}

TEST_CASE("SessionRunner sends the request as the first line", "[runner]")
{
    auto const temp = TempDir {};
    auto const capture = temp.path / "stdin.log";
    auto const script = std::format(R"(read -r request
printf '%s\n' "$request" > '{}'
echo '{{"type":"done","success":true}}'
)",
                                    capture.string());

    auto runner = SessionRunner(scriptedWorker(script), temp.path);
    auto request = makeRequest("first line");
    auto context = RunContext(request.runId);
    auto source = std::stop_source {};
    auto const outcome = runner.run(request, context, nullptr, source.get_token());

    CHECK(outcome.success);
    auto decoded = decodeRequest(readFile(capture));
    REQUIRE(decoded.has_value());
    CHECK(*decoded == request);
}

TEST_CASE("SessionRunner does not send answers when the round is cancelled", "[runner]")
{
    auto const temp = TempDir {};
    auto const capture = temp.path / "stdin.log";
    auto const script = std::format(R"(read -r request
echo '{{"type":"clarifying_questions","questions":[{{"label":"Era","question":"Which era?"}}]}}'
while read -r line; do printf '%s\n' "$line" >> '{}'; done
)",
                                    capture.string());

    auto runner = SessionRunner(scriptedWorker(script), temp.path);
    auto request = makeRequest("ambiguous topic");
    auto context = RunContext(request.runId);
    auto source = std::stop_source {};
    auto const outcome = runner.run(
        request,
        context,
        [&](const WorkerEvent& event) {
            if (std::holds_alternative<ClarifyingQuestionsEvent>(event))
                context.cancelClarification();
        },
        source.get_token());

    CHECK(outcome.cancelled);
    CHECK(!outcome.success);
    CHECK(!outcome.doneSeen);
    CHECK(readFile(capture).find("answers") == std::string::npos);
    CHECK(std::filesystem::exists(outcome.runDir / "request.json"));
    CHECK(std::filesystem::exists(outcome.runDir / "metadata.json"));
    CHECK(!std::filesystem::exists(outcome.runDir / "output.md"));
}

TEST_CASE("SessionRunner forwards answers and continues the run", "[runner]")
{
    auto const temp = TempDir {};
    auto const script = std::string(R"(read -r request
echo '{"type":"clarifying_questions","questions":[{"label":"Era","question":"Which era?"}]}'
read -r answers
case "$answers" in
  *1990s*) echo '{"type":"done","success":true}' ;;
  *) echo '{"type":"done","success":false}' ;;
esac
)");

    auto runner = SessionRunner(scriptedWorker(script), temp.path);
    auto request = makeRequest("ambiguous topic");
    auto context = RunContext(request.runId);
    auto source = std::stop_source {};
    auto const outcome = runner.run(
        request,
        context,
        [&](const WorkerEvent& event) {
            if (std::holds_alternative<ClarifyingQuestionsEvent>(event))
                context.fulfillAnswers({ "1990s" });
        },
        source.get_token());

    CHECK(outcome.success);
    CHECK(outcome.doneSuccess);
    CHECK(!outcome.cancelled);
}

TEST_CASE("SessionRunner skips malformed lines and keeps reading", "[runner]")
{
    auto const temp = TempDir {};
    auto const script = std::string(R"(read -r request
echo 'Traceback (most recent call last):'
echo ''
echo '{"type":"status","message":"still here"}'
echo '{"type":"unknown_kind"}'
echo '{"type":"done","success":true}'
)");

    auto runner = SessionRunner(scriptedWorker(script), temp.path);
    auto request = makeRequest("noisy worker");
    auto context = RunContext(request.runId);
    auto source = std::stop_source {};
    auto const outcome = runner.run(request, context, nullptr, source.get_token());

    CHECK(outcome.success);
    CHECK(outcome.malformedLines == 3);
}

TEST_CASE("SessionRunner reports failure when done is missing or unsuccessful", "[runner]")
{
    auto const temp = TempDir {};

    SECTION("no done event")
    {
        auto runner = SessionRunner(scriptedWorker("read -r request"), temp.path);
        auto request = makeRequest("silent");
        auto context = RunContext(request.runId);
        auto source = std::stop_source {};
        auto const outcome = runner.run(request, context, nullptr, source.get_token());
        CHECK(!outcome.success);
        CHECK(!outcome.doneSeen);
        CHECK(outcome.exitSuccess);
    }

    SECTION("done with success false")
    {
        auto runner = SessionRunner(
            scriptedWorker("read -r request; echo '{\"type\":\"done\",\"success\":false}'"), temp.path);
        auto request = makeRequest("failing");
        auto context = RunContext(request.runId);
        auto source = std::stop_source {};
        auto const outcome = runner.run(request, context, nullptr, source.get_token());
        CHECK(!outcome.success);
        CHECK(outcome.doneSeen);
        CHECK(!outcome.doneSuccess);
    }

    SECTION("non-zero exit after done")
    {
        auto runner = SessionRunner(
            scriptedWorker("read -r request; echo '{\"type\":\"done\",\"success\":true}'; exit 1"), temp.path);
        auto request = makeRequest("crashing");
        auto context = RunContext(request.runId);
        auto source = std::stop_source {};
        auto const outcome = runner.run(request, context, nullptr, source.get_token());
        CHECK(!outcome.success);
        CHECK(outcome.doneSuccess);
        CHECK(!outcome.exitSuccess);
    }
}

TEST_CASE("SessionRunner reports a SyncError when the worker exits mid-round", "[runner]")
{
    auto const temp = TempDir {};
    auto const script = std::string(R"(read -r request
echo '{"type":"clarifying_questions","questions":[{"label":"Era","question":"Which era?"}]}'
exit 0
)");

    auto runner = SessionRunner(scriptedWorker(script), temp.path);
    auto request = makeRequest("vanishing worker");
    auto context = RunContext(request.runId);
    auto source = std::stop_source {};
    auto const outcome = runner.run(request, context, nullptr, source.get_token());

    CHECK(!outcome.success);
    REQUIRE(outcome.failure.has_value());
    CHECK(outcome.failure->code == ErrorCode::SyncError);
}
#endif

TEST_CASE("SessionRunner reports a launch failure", "[runner]")
{
    auto const runsRoot = std::filesystem::temp_directory_path() / ("lode_runner_" + generateRunId());
    auto runner = SessionRunner(WorkerLaunch { .command = "/nonexistent/research/worker" }, runsRoot);
    auto request = Request { .runId = generateRunId(), .query = "anything" };
    auto context = RunContext(request.runId);
    auto source = std::stop_source {};
    auto const outcome = runner.run(request, context, nullptr, source.get_token());

    CHECK(!outcome.success);
    CHECK(context.isReleased());
    if (outcome.failure)
        CHECK(outcome.failure->code == ErrorCode::LaunchError);

    auto ec = std::error_code {};
    std::filesystem::remove_all(runsRoot, ec);
}
