// SPDX-License-Identifier: Apache-2.0
#include "RunId.hpp"

#include <uuid.h>

#include <algorithm>
#include <array>
#include <functional>
#include <iterator>
#include <mutex>
#include <random>

namespace lode
{

namespace
{
    auto seededEngine() -> std::mt19937
    {
        auto device = std::random_device {};
        auto seedData = std::array<int, std::mt19937::state_size> {};
        std::generate(std::begin(seedData), std::end(seedData), std::ref(device));
        auto sequence = std::seed_seq(std::begin(seedData), std::end(seedData));
        return std::mt19937(sequence);
    }
} // namespace

auto generateRunId() -> std::string
{
    static auto mutex = std::mutex {};
    static auto engine = seededEngine();
    static auto generator = uuids::uuid_random_generator { engine };

    auto const lock = std::lock_guard(mutex);
    return uuids::to_string(generator());
}

auto shortRunId(std::string_view runId) -> std::string_view
{
    return runId.substr(0, std::min<std::size_t>(8, runId.size()));
}

} // namespace lode
