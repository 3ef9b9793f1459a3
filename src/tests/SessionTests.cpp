// SPDX-License-Identifier: Apache-2.0
#include "MockWorkerChannel.hpp"

#include <core/Log.hpp>
#include <core/RunId.hpp>
#include <session/AnswerHandoff.hpp>
#include <session/ArtifactSink.hpp>
#include <session/EventRouter.hpp>
#include <session/InterruptPath.hpp>
#include <session/RunContext.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>

using namespace lode;
using lode::testing::MockWorkerChannel;

namespace
{

struct TempDir
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / ("lode_test_" + generateRunId());

    TempDir() { std::filesystem::create_directories(path); }
    ~TempDir()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(path, ec);
    }
};

auto readFile(const std::filesystem::path& path) -> std::string
{
    auto file = std::ifstream(path);
    auto buffer = std::stringstream {};
    buffer << file.rdbuf();
    return buffer.str();
}

/// Captures warnings for the lifetime of the object.
struct LogCapture
{
    std::mutex mutex;
    std::vector<std::string> warnings;

    log::ScopedSink sink { [this](log::Level level, std::string_view message) {
        if (level != log::Level::Warning)
            return;
        auto const lock = std::lock_guard(mutex);
        warnings.emplace_back(message);
    } };
};

} // namespace

// --- ArtifactSink ---

TEST_CASE("artifactStem pads the sequence and normalizes the agent name", "[artifacts]")
{
    CHECK(ArtifactSink::artifactStem(1, "Planner") == "001-planner");
    CHECK(ArtifactSink::artifactStem(42, "Web/Search\\Agent") == "042-web_search_agent");
    CHECK(ArtifactSink::artifactStem(1234, "x") == "1234-x");
}

TEST_CASE("ArtifactSink writes the run directory layout", "[artifacts]")
{
    auto const temp = TempDir {};
    auto sink = ArtifactSink(temp.path, "run-1");
    REQUIRE(sink.prepare().has_value());
    CHECK(sink.runDir() == temp.path / "run-1");

    auto const request = Request { .runId = "run-1", .query = "History of quantum computing" };
    REQUIRE(sink.writeRequest(request).has_value());
    REQUIRE(sink.writePrompt(PromptEvent { .agent = "Planner", .sequence = 1, .content = "plan it" }).has_value());
    REQUIRE(sink.writeAgentOutput(AgentOutputEvent {
                                      .agent = "Planner",
                                      .sequence = 1,
                                      .content = "{\"searches\":[]}",
                                      .tokenUsage = TokenUsage { .promptTokens = 3, .completionTokens = 4, .totalTokens = 7 },
                                  })
                .has_value());
    REQUIRE(sink.writeReport(ReportEvent { .shortSummary = "s", .markdownReport = "# Report\n" }).has_value());

    auto const runDir = sink.runDir();
    auto const requestJson = nlohmann::json::parse(readFile(runDir / "request.json"));
    CHECK(requestJson["run_id"] == "run-1");
    CHECK(requestJson["query"] == "History of quantum computing");
    CHECK(requestJson["config"]["model"] == "gpt-4o");

    CHECK(readFile(runDir / "prompts" / "001-planner.txt") == "plan it");

    auto const response = nlohmann::json::parse(readFile(runDir / "raw_responses" / "001-planner.json"));
    CHECK(response["agent"] == "Planner");
    CHECK(response["sequence"] == 1);
    CHECK(response["token_usage"]["total_tokens"] == 7);

    CHECK(readFile(runDir / "output.md") == "# Report\n");
}

TEST_CASE("ArtifactSink metadata uses null for unknown values", "[artifacts]")
{
    auto const temp = TempDir {};
    auto sink = ArtifactSink(temp.path, "run-2");
    REQUIRE(sink.prepare().has_value());
    REQUIRE(sink.finalize().has_value());

    auto const metadata = nlohmann::json::parse(readFile(sink.runDir() / "metadata.json"));
    CHECK(metadata["run_id"] == "run-2");
    CHECK(metadata["model"].is_null());
    CHECK(metadata["total_tokens"].is_null());
    CHECK(metadata["trace_id"].is_null());
    CHECK(metadata["trace_url"].is_null());
    CHECK(metadata["duration_ms"].is_number_integer());
}

TEST_CASE("ArtifactSink metadata records trace and model", "[artifacts]")
{
    auto const temp = TempDir {};
    auto sink = ArtifactSink(temp.path, "run-3");
    REQUIRE(sink.prepare().has_value());
    sink.noteTrace(TraceEvent { .traceId = "t-9", .traceUrl = "https://example.test/t-9" });
    sink.noteMetadata(MetadataEvent { .model = "gpt-4o-mini", .totalTokens = 512, .durationMs = 10 });
    REQUIRE(sink.finalize().has_value());

    auto const metadata = nlohmann::json::parse(readFile(sink.runDir() / "metadata.json"));
    CHECK(metadata["model"] == "gpt-4o-mini");
    CHECK(metadata["total_tokens"] == 512);
    CHECK(metadata["trace_id"] == "t-9");
    CHECK(metadata["trace_url"] == "https://example.test/t-9");
}

TEST_CASE("ArtifactSink reports PersistenceError for an unwritable root", "[artifacts]")
{
    auto const temp = TempDir {};
    auto const blocker = temp.path / "file";
    {
        auto file = std::ofstream(blocker);
        file << "x";
    }
    auto sink = ArtifactSink(blocker, "run-4");
    auto result = sink.prepare();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::PersistenceError);
}

// --- AnswerHandoff ---

TEST_CASE("AnswerHandoff honours only the first resolution", "[handoff]")
{
    auto handoff = AnswerHandoff {};
    CHECK(!handoff.isResolved());
    CHECK(handoff.fulfill({ "a", "b" }));
    CHECK(!handoff.cancel());
    CHECK(!handoff.abandon());
    CHECK(handoff.isResolved());

    auto const result = handoff.waitFor(std::chrono::milliseconds(0));
    REQUIRE(result.has_value());
    CHECK(result->outcome == HandoffOutcome::Answered);
    CHECK(result->answers == std::vector<std::string> { "a", "b" });
}

TEST_CASE("AnswerHandoff waitFor times out while unresolved", "[handoff]")
{
    auto handoff = AnswerHandoff {};
    CHECK(!handoff.waitFor(std::chrono::milliseconds(10)).has_value());
}

TEST_CASE("AnswerHandoff wakes a waiter resolved from another thread", "[handoff]")
{
    auto handoff = AnswerHandoff {};
    auto resolver = std::jthread([&handoff] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        handoff.cancel();
    });

    auto const result = handoff.waitFor(std::chrono::seconds(5));
    REQUIRE(result.has_value());
    CHECK(result->outcome == HandoffOutcome::Cancelled);
    CHECK(result->answers.empty());
}

// --- InterruptPath ---

TEST_CASE("InterruptPath forwards commands to the worker in order", "[interrupt]")
{
    auto worker = MockWorkerChannel {};
    auto path = InterruptPath(worker);
    CHECK(path.send(InterruptCommand::Pause));
    CHECK(path.send(InterruptCommand::ForceWrite));
    REQUIRE(worker.waitForWrites(2));
    path.close();

    auto const lines = worker.written();
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == encodeInterrupt(InterruptCommand::Pause));
    CHECK(lines[1] == encodeInterrupt(InterruptCommand::ForceWrite));
}

TEST_CASE("InterruptPath rejects commands after close", "[interrupt]")
{
    auto worker = MockWorkerChannel {};
    auto path = InterruptPath(worker);
    path.close();
    CHECK(!path.send(InterruptCommand::Stop));
    CHECK(worker.written().empty());
}

TEST_CASE("InterruptPath survives a worker whose input is closed", "[interrupt]")
{
    auto worker = MockWorkerChannel {};
    worker.closeInput();
    auto path = InterruptPath(worker);
    CHECK(path.send(InterruptCommand::Stop));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    path.close();
    CHECK(worker.written().empty());
}

// --- RunContext ---

TEST_CASE("RunContext opens exactly one clarifying round", "[context]")
{
    auto context = RunContext("run");
    CHECK(!context.hasClarified());
    auto handoff = context.openClarification();
    REQUIRE(handoff != nullptr);
    CHECK(context.hasClarified());
    CHECK(context.hasPendingClarification());
    CHECK(context.openClarification() == nullptr);

    CHECK(context.fulfillAnswers({ "x" }));
    CHECK(!context.hasPendingClarification());
    CHECK(!context.fulfillAnswers({ "y" }));
    CHECK(!context.cancelClarification());
}

TEST_CASE("RunContext release abandons the round and drops interrupts", "[context]")
{
    auto worker = MockWorkerChannel {};
    auto context = RunContext("run");
    context.bindWorker(worker);
    auto handoff = context.openClarification();
    REQUIRE(handoff != nullptr);

    context.release();
    CHECK(context.isReleased());

    auto const result = handoff->waitFor(std::chrono::milliseconds(0));
    REQUIRE(result.has_value());
    CHECK(result->outcome == HandoffOutcome::Abandoned);

    CHECK(!context.sendInterrupt(InterruptCommand::Stop));
    CHECK(!context.fulfillAnswers({}));
    CHECK(context.openClarification() == nullptr);
    CHECK(worker.written().empty());
}

TEST_CASE("RunContext without a worker drops interrupts", "[context]")
{
    auto context = RunContext("run");
    CHECK(!context.sendInterrupt(InterruptCommand::Pause));
}

// --- EventRouter ---

TEST_CASE("EventRouter warns once for every malformed or blank line", "[router]")
{
    auto capture = LogCapture {};
    auto const temp = TempDir {};
    auto worker = MockWorkerChannel {};
    auto context = RunContext("run");
    auto sink = ArtifactSink(temp.path, "run");
    REQUIRE(sink.prepare().has_value());

    auto seen = std::vector<std::string> {};
    auto router = EventRouter(context, sink, worker, [&](const WorkerEvent& event) {
        seen.emplace_back(eventTypeName(event));
    });

    auto source = std::stop_source {};
    CHECK(router.handleLine("", source.get_token()).has_value());
    CHECK(router.handleLine("   \r", source.get_token()).has_value());
    CHECK(router.handleLine("Traceback (most recent call last):", source.get_token()).has_value());
    CHECK(router.handleLine(R"({"type":"status","message":"Working"})", source.get_token()).has_value());
    CHECK(router.handleLine(R"({"type":"done","success":true})", source.get_token()).has_value());

    CHECK(router.malformedLines() == 3);
    CHECK(seen == std::vector<std::string> { "status", "done" });
    CHECK(router.doneSeen());
    CHECK(router.doneSuccess());

    auto const lock = std::lock_guard(capture.mutex);
    REQUIRE(capture.warnings.size() == 3);
    for (auto const& warning: capture.warnings)
        CHECK(warning.starts_with("failed to parse response:"));
}

TEST_CASE("EventRouter persists prompts, responses and the report", "[router]")
{
    auto const temp = TempDir {};
    auto worker = MockWorkerChannel {};
    auto context = RunContext("run");
    auto sink = ArtifactSink(temp.path, "run");
    REQUIRE(sink.prepare().has_value());
    auto router = EventRouter(context, sink, worker, nullptr);

    auto source = std::stop_source {};
    REQUIRE(router.handleLine(R"({"type":"prompt","agent":"Writer","sequence":2,"content":"write"})",
                              source.get_token())
                .has_value());
    REQUIRE(router.handleLine(R"({"type":"raw_response","agent":"Writer","sequence":2,"content":"done"})",
                              source.get_token())
                .has_value());
    REQUIRE(router
                .handleLine(R"({"type":"report","short_summary":"s","markdown_report":"# Title","follow_up_questions":[]})",
                            source.get_token())
                .has_value());

    CHECK(router.reportSeen());
    CHECK(!router.doneSeen());
    CHECK(readFile(sink.runDir() / "prompts" / "002-writer.txt") == "write");
    CHECK(std::filesystem::exists(sink.runDir() / "raw_responses" / "002-writer.json"));
    CHECK(readFile(sink.runDir() / "output.md") == "# Title");
}

TEST_CASE("EventRouter answers an empty clarifying round immediately", "[router]")
{
    auto const temp = TempDir {};
    auto worker = MockWorkerChannel {};
    auto context = RunContext("run");
    auto sink = ArtifactSink(temp.path, "run");
    REQUIRE(sink.prepare().has_value());
    auto router = EventRouter(context, sink, worker, nullptr);

    auto source = std::stop_source {};
    REQUIRE(router.handleLine(R"({"type":"clarifying_questions","questions":[]})", source.get_token()).has_value());

    CHECK(router.answersSent());
    CHECK(worker.written() == std::vector<std::string> { "{\"answers\":[]}\n" });
}

TEST_CASE("EventRouter forwards the user's answers", "[router]")
{
    auto const temp = TempDir {};
    auto worker = MockWorkerChannel {};
    auto context = RunContext("run");
    auto sink = ArtifactSink(temp.path, "run");
    REQUIRE(sink.prepare().has_value());

    auto answerer = std::jthread {};
    auto router = EventRouter(context, sink, worker, [&](const WorkerEvent& event) {
        if (!std::holds_alternative<ClarifyingQuestionsEvent>(event))
            return;
        // The round is already open when the observer runs.
        CHECK(context.hasPendingClarification());
        answerer = std::jthread([&context] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            context.fulfillAnswers({ "1990s", "Beginner" });
        });
    });

    auto source = std::stop_source {};
    auto const line = std::string(R"({"type":"clarifying_questions","questions":[
        {"label":"Era","question":"Which era?"},{"label":"Level","question":"Which level?"}]})");
    auto result = router.handleLine(line, source.get_token());
    REQUIRE(result.has_value());
    CHECK(router.answersSent());
    CHECK(worker.written() == std::vector<std::string> { encodeAnswers({ "1990s", "Beginner" }) });

    // A second round is observed but not awaited.
    REQUIRE(router.handleLine(line, source.get_token()).has_value());
    CHECK(worker.written().size() == 1);
}

TEST_CASE("EventRouter stops the worker when the round is cancelled", "[router]")
{
    auto const temp = TempDir {};
    auto worker = MockWorkerChannel {};
    auto context = RunContext("run");
    auto sink = ArtifactSink(temp.path, "run");
    REQUIRE(sink.prepare().has_value());
    auto router = EventRouter(context, sink, worker, [&](const WorkerEvent& event) {
        if (std::holds_alternative<ClarifyingQuestionsEvent>(event))
            context.cancelClarification();
    });

    auto source = std::stop_source {};
    auto result = router.handleLine(
        R"({"type":"clarifying_questions","questions":[{"label":"Era","question":"Which era?"}]})",
        source.get_token());
    REQUIRE(result.has_value());

    CHECK(router.cancelled());
    CHECK(!router.answersSent());
    CHECK(worker.written() == std::vector<std::string> { encodeInterrupt(InterruptCommand::Stop) });
    CHECK(worker.inputClosed());
    CHECK(worker.terminated());
}

TEST_CASE("EventRouter reports a SyncError when the worker dies mid-round", "[router]")
{
    auto const temp = TempDir {};
    auto worker = MockWorkerChannel {};
    worker.setRunning(false);
    auto context = RunContext("run");
    auto sink = ArtifactSink(temp.path, "run");
    REQUIRE(sink.prepare().has_value());
    auto router = EventRouter(context, sink, worker, nullptr);

    auto source = std::stop_source {};
    auto result = router.handleLine(
        R"({"type":"clarifying_questions","questions":[{"label":"Era","question":"Which era?"}]})",
        source.get_token());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SyncError);
    CHECK(worker.written().empty());
}

TEST_CASE("EventRouter reports Cancelled when stopped mid-round", "[router]")
{
    auto const temp = TempDir {};
    auto worker = MockWorkerChannel {};
    auto context = RunContext("run");
    auto sink = ArtifactSink(temp.path, "run");
    REQUIRE(sink.prepare().has_value());
    auto router = EventRouter(context, sink, worker, nullptr);

    auto source = std::stop_source {};
    source.request_stop();
    auto result = router.handleLine(
        R"({"type":"clarifying_questions","questions":[{"label":"Era","question":"Which era?"}]})",
        source.get_token());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
}
