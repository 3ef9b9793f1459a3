// SPDX-License-Identifier: Apache-2.0
#include <session/WorkerProcess.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace lode;

namespace
{

auto shellLaunch(std::string script) -> WorkerLaunch
{
    return WorkerLaunch {
        .command = "/bin/sh",
        .args = { "-c", std::move(script) },
        .env = {},
        .stderrMode = StderrMode::Discard,
    };
}

} // namespace

TEST_CASE("WorkerProcess operations fail before start", "[worker]")
{
    auto worker = WorkerProcess {};
    CHECK(!worker.isRunning());

    auto written = worker.writeLine("{}\n");
    REQUIRE(!written.has_value());
    CHECK(written.error().code == ErrorCode::TransportError);
}

TEST_CASE("WorkerProcess rejects an empty command", "[worker]")
{
    auto worker = WorkerProcess {};
    auto result = worker.start(WorkerLaunch {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::LaunchError);
}

#ifndef _WIN32
TEST_CASE("WorkerProcess exchanges lines with a child process", "[worker]")
{
    auto worker = WorkerProcess {};
    REQUIRE(worker.start(WorkerLaunch { .command = "cat" }).has_value());
    CHECK(worker.isRunning());

    REQUIRE(worker.writeLine("{\"type\":\"status\",\"message\":\"hello\"}\n").has_value());
    REQUIRE(worker.writeLine("second\n").has_value());

    auto source = std::stop_source {};
    auto first = worker.readLine(source.get_token());
    REQUIRE(first.has_value());
    REQUIRE(first->has_value());
    CHECK(**first == "{\"type\":\"status\",\"message\":\"hello\"}");

    auto second = worker.readLine(source.get_token());
    REQUIRE(second.has_value());
    REQUIRE(second->has_value());
    CHECK(**second == "second");

    worker.closeInput();
    auto eof = worker.readLine(source.get_token());
    REQUIRE(eof.has_value());
    CHECK(!eof->has_value());

    auto exited = worker.wait();
    REQUIRE(exited.has_value());
    CHECK(*exited);
    CHECK(!worker.isRunning());
}

TEST_CASE("WorkerProcess delivers a final line without a newline", "[worker]")
{
    auto worker = WorkerProcess {};
    REQUIRE(worker.start(shellLaunch("printf 'one\\ntwo'")).has_value());

    auto source = std::stop_source {};
    auto one = worker.readLine(source.get_token());
    REQUIRE(one.has_value());
    REQUIRE(one->has_value());
    CHECK(**one == "one");

    auto two = worker.readLine(source.get_token());
    REQUIRE(two.has_value());
    REQUIRE(two->has_value());
    CHECK(**two == "two");

    auto eof = worker.readLine(source.get_token());
    REQUIRE(eof.has_value());
    CHECK(!eof->has_value());
    CHECK(worker.wait().has_value());
}

TEST_CASE("WorkerProcess reports a non-zero exit status", "[worker]")
{
    auto worker = WorkerProcess {};
    REQUIRE(worker.start(shellLaunch("exit 3")).has_value());
    auto exited = worker.wait();
    REQUIRE(exited.has_value());
    CHECK(!*exited);
}

TEST_CASE("WorkerProcess passes environment overrides", "[worker]")
{
    auto launch = shellLaunch("echo \"$LODE_TEST_VALUE\"");
    launch.env["LODE_TEST_VALUE"] = "from-launch";

    auto worker = WorkerProcess {};
    REQUIRE(worker.start(launch).has_value());

    auto source = std::stop_source {};
    auto line = worker.readLine(source.get_token());
    REQUIRE(line.has_value());
    REQUIRE(line->has_value());
    CHECK(**line == "from-launch");
    CHECK(worker.wait().has_value());
}

TEST_CASE("WorkerProcess readLine honours a stop request", "[worker]")
{
    auto worker = WorkerProcess {};
    REQUIRE(worker.start(shellLaunch("sleep 30")).has_value());

    auto source = std::stop_source {};
    source.request_stop();
    auto line = worker.readLine(source.get_token());
    REQUIRE(!line.has_value());
    CHECK(line.error().code == ErrorCode::Cancelled);

    worker.terminate();
    CHECK(!worker.isRunning());
}

TEST_CASE("WorkerProcess terminate kills a child that ignores SIGTERM", "[worker]")
{
    auto worker = WorkerProcess {};
    REQUIRE(worker.start(shellLaunch("trap '' TERM; exec sleep 30")).has_value());
    CHECK(worker.isRunning());
    worker.terminate();
    CHECK(!worker.isRunning());
}
#endif

TEST_CASE("WorkerProcess fails to start an invalid command", "[worker]")
{
    auto worker = WorkerProcess {};
    auto result = worker.start(WorkerLaunch { .command = "/nonexistent/command/that/does/not/exist" });
    // Some libcs report the failure from posix_spawnp, others only through the exit status.
    if (result.has_value())
    {
        auto exited = worker.wait();
        CHECK((!exited.has_value() || !*exited));
    }
    else
    {
        CHECK(result.error().code == ErrorCode::LaunchError);
    }
}
