// SPDX-License-Identifier: Apache-2.0
#include <core/RunId.hpp>
#include <session/Orchestrator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <thread>

using namespace lode;

#ifndef _WIN32
namespace
{

struct TempDir
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / ("lode_orchestrator_" + generateRunId());

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

/// Receives session events until RunFinished arrives or the timeout expires.
auto collectUntilFinished(Channel<SessionEvent>& events,
                          std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> std::vector<SessionEvent>
{
    auto collected = std::vector<SessionEvent> {};
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        auto event = events.tryReceive();
        if (!event)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            continue;
        }
        auto const finished = std::holds_alternative<RunFinished>(*event);
        collected.push_back(std::move(*event));
        if (finished)
            break;
    }
    return collected;
}

/// Waits for a worker event of type T and returns the run id it belongs to.
template <typename T>
auto waitForWorkerEvent(Channel<SessionEvent>& events) -> std::string
{
    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline)
    {
        auto event = events.tryReceive();
        if (!event)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            continue;
        }
        if (auto const* notice = std::get_if<WorkerEventNotice>(&*event))
        {
            if (std::holds_alternative<T>(notice->event))
                return notice->runId;
        }
    }
    return {};
}

} // namespace

TEST_CASE("Orchestrator runs a submitted query and reports its lifecycle", "[orchestrator]")
{
    auto const temp = TempDir {};
    auto events = Channel<SessionEvent> {};
    auto orchestrator = Orchestrator(RequestConfig {},
                                     scriptedWorker(R"(read -r request
echo '{"type":"status","message":"working"}'
echo '{"type":"done","success":true}')"),
                                     temp.path,
                                     events);
    orchestrator.start();
    REQUIRE(orchestrator.submit(SubmitQuery { .query = "History of quantum computing" }));

    auto const collected = collectUntilFinished(events);
    REQUIRE(collected.size() == 4);

    auto const* started = std::get_if<RunStarted>(&collected[0]);
    REQUIRE(started != nullptr);
    CHECK(started->runDir == temp.path / started->runId);

    auto const* status = std::get_if<WorkerEventNotice>(&collected[1]);
    REQUIRE(status != nullptr);
    CHECK(status->runId == started->runId);
    CHECK(std::holds_alternative<StatusEvent>(status->event));

    auto const* finished = std::get_if<RunFinished>(&collected[3]);
    REQUIRE(finished != nullptr);
    CHECK(finished->runId == started->runId);
    CHECK(finished->success);
    CHECK(!orchestrator.isRunActive());

    orchestrator.shutdown(std::chrono::milliseconds(500));
    CHECK(!orchestrator.submit(SubmitQuery { .query = "too late" }));
}

TEST_CASE("Orchestrator routes answers to the active run only", "[orchestrator]")
{
    auto const temp = TempDir {};
    auto events = Channel<SessionEvent> {};
    auto orchestrator = Orchestrator(RequestConfig {},
                                     scriptedWorker(R"(read -r request
echo '{"type":"clarifying_questions","questions":[{"label":"Era","question":"Which era?"}]}'
read -r answers
case "$answers" in
  *modern*) echo '{"type":"done","success":true}' ;;
  *) echo '{"type":"done","success":false}' ;;
esac)"),
                                     temp.path,
                                     events);
    orchestrator.start();
    REQUIRE(orchestrator.submit(SubmitQuery { .query = "ambiguous" }));

    auto const runId = waitForWorkerEvent<ClarifyingQuestionsEvent>(events);
    REQUIRE(!runId.empty());
    CHECK(orchestrator.isRunActive());

    // Stale commands are dropped without touching the active round.
    REQUIRE(orchestrator.submit(SubmitAnswers { .runId = "some-other-run", .answers = { "ancient" } }));
    REQUIRE(orchestrator.submit(CancelClarification { .runId = "some-other-run" }));
    REQUIRE(orchestrator.submit(SubmitAnswers { .runId = runId, .answers = { "modern" } }));

    auto const collected = collectUntilFinished(events);
    REQUIRE(!collected.empty());
    auto const* finished = std::get_if<RunFinished>(&collected.back());
    REQUIRE(finished != nullptr);
    CHECK(finished->runId == runId);
    CHECK(finished->success);

    orchestrator.shutdown(std::chrono::milliseconds(500));
}

TEST_CASE("Orchestrator shutdown stops an active run", "[orchestrator]")
{
    auto const temp = TempDir {};
    auto events = Channel<SessionEvent> {};
    auto orchestrator = Orchestrator(RequestConfig {},
                                     scriptedWorker(R"(read -r request
echo '{"type":"status","message":"thinking"}'
exec sleep 30)"),
                                     temp.path,
                                     events);
    orchestrator.start();
    REQUIRE(orchestrator.submit(SubmitQuery { .query = "slow" }));
    REQUIRE(!waitForWorkerEvent<StatusEvent>(events).empty());

    orchestrator.shutdown(std::chrono::milliseconds(100));
    CHECK(!orchestrator.isRunActive());

    auto const collected = collectUntilFinished(events, std::chrono::seconds(1));
    REQUIRE(!collected.empty());
    auto const* finished = std::get_if<RunFinished>(&collected.back());
    REQUIRE(finished != nullptr);
    CHECK(!finished->success);
    CHECK(finished->cancelled);
}

TEST_CASE("Orchestrator reports a worker that cannot be launched", "[orchestrator]")
{
    auto const temp = TempDir {};
    auto events = Channel<SessionEvent> {};
    auto orchestrator =
        Orchestrator(RequestConfig {}, WorkerLaunch { .command = "/nonexistent/research/worker" }, temp.path, events);
    orchestrator.start();
    REQUIRE(orchestrator.submit(SubmitQuery { .query = "anything" }));

    auto const collected = collectUntilFinished(events);
    REQUIRE(!collected.empty());
    auto const* finished = std::get_if<RunFinished>(&collected.back());
    REQUIRE(finished != nullptr);
    CHECK(!finished->success);
    orchestrator.shutdown(std::chrono::milliseconds(0));
}
#endif
