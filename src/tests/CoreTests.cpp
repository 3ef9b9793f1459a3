// SPDX-License-Identifier: Apache-2.0
#include <core/Channel.hpp>
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/RunId.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace lode;

TEST_CASE("Channel delivers values in send order", "[channel]")
{
    auto channel = Channel<int> {};
    CHECK(channel.send(1));
    CHECK(channel.send(2));
    CHECK(channel.send(3));
    CHECK(channel.size() == 3);

    auto const first = channel.tryReceive();
    REQUIRE(first.has_value());
    CHECK(*first == 1);

    auto const rest = channel.drain();
    CHECK(rest == std::vector<int> { 2, 3 });
    CHECK(!channel.tryReceive().has_value());
}

TEST_CASE("Channel rejects sends after close but keeps queued values", "[channel]")
{
    auto channel = Channel<std::string> {};
    REQUIRE(channel.send("queued"));
    channel.close();

    CHECK(channel.isClosed());
    CHECK(!channel.send("late"));

    auto source = std::stop_source {};
    auto const value = channel.receive(source.get_token());
    REQUIRE(value.has_value());
    CHECK(*value == "queued");
    CHECK(!channel.receive(source.get_token()).has_value());
}

TEST_CASE("Channel receive wakes up on a value from another thread", "[channel]")
{
    auto channel = Channel<int> {};
    auto producer = std::jthread([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.send(42);
    });

    auto source = std::stop_source {};
    auto const value = channel.receive(source.get_token());
    REQUIRE(value.has_value());
    CHECK(*value == 42);
}

TEST_CASE("Channel receive returns nullopt when a stop is requested", "[channel]")
{
    auto channel = Channel<int> {};
    auto source = std::stop_source {};
    auto stopper = std::jthread([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.request_stop();
    });

    CHECK(!channel.receive(source.get_token()).has_value());
}

TEST_CASE("generateRunId produces distinct version 4 UUIDs", "[runid]")
{
    auto ids = std::set<std::string> {};
    for (auto i = 0; i < 64; ++i)
    {
        auto id = generateRunId();
        REQUIRE(id.size() == 36);
        CHECK(id[8] == '-');
        CHECK(id[13] == '-');
        CHECK(id[14] == '4');
        CHECK(id[18] == '-');
        CHECK(id[23] == '-');
        ids.insert(std::move(id));
    }
    CHECK(ids.size() == 64);
}

TEST_CASE("shortRunId keeps the first eight characters", "[runid]")
{
    CHECK(shortRunId("8f14e45f-ceea-467f-a0e6-7d5e6c3b1a2b") == "8f14e45f");
    CHECK(shortRunId("abc") == "abc");
}

TEST_CASE("Error formats with its code name", "[error]")
{
    auto const error = Error { .code = ErrorCode::LaunchError, .message = "worker not found" };
    CHECK(errorCodeName(error.code) == "LAUNCH_ERROR");
    CHECK(std::format("{}", error).find("worker not found") != std::string::npos);
}

TEST_CASE("log level names parse back case-insensitively", "[log]")
{
    CHECK(log::levelName(log::Level::Warning) == "warning");
    CHECK(log::parseLevel("DEBUG") == log::Level::Debug);
    CHECK(log::parseLevel("warn") == log::Level::Warning);
    CHECK(log::parseLevel("Trace") == log::Level::Trace);
    CHECK(!log::parseLevel("loud").has_value());
    CHECK(!log::parseLevel("").has_value());
}

TEST_CASE("ScopedSink filters by level and restores the previous sink", "[log]")
{
    auto const savedLevel = log::level();
    log::setLevel(log::Level::Info);

    auto outer = std::vector<std::pair<log::Level, std::string>> {};
    {
        auto const outerSink = log::ScopedSink([&](log::Level level, std::string_view message) {
            outer.emplace_back(level, std::string(message));
        });

        auto inner = std::vector<std::string> {};
        {
            auto const innerSink =
                log::ScopedSink([&](log::Level, std::string_view message) { inner.emplace_back(message); });
            log::warning("run {} stalled", 7);
            log::debug("hidden");
        }
        CHECK(inner == std::vector<std::string> { "run 7 stalled" });

        log::error("after");
    }

    REQUIRE(outer.size() == 1);
    CHECK(outer[0].first == log::Level::Error);
    CHECK(outer[0].second == "after");

    log::setLevel(savedLevel);
}
