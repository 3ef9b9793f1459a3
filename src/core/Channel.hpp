// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace lode
{

/// @brief Unbounded multi-producer queue for handing values between threads.
///
/// Producers call send(); a consumer either blocks in receive() or drains
/// without blocking via tryReceive()/drain(). After close(), send() is
/// rejected and receive() returns nullopt once the queue is empty.
template <typename T>
class Channel
{
  public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @brief Enqueues a value.
    /// @return False if the channel is closed and the value was dropped.
    auto send(T value) -> bool
    {
        {
            auto const lock = std::lock_guard(_mutex);
            if (_closed)
                return false;
            _queue.push_back(std::move(value));
        }
        _cv.notify_one();
        return true;
    }

    /// @brief Dequeues a value without blocking.
    [[nodiscard]] auto tryReceive() -> std::optional<T>
    {
        auto const lock = std::lock_guard(_mutex);
        if (_queue.empty())
            return std::nullopt;
        auto value = std::move(_queue.front());
        _queue.pop_front();
        return value;
    }

    /// @brief Blocks until a value is available, the channel is closed, or a stop is requested.
    /// @return The value, or nullopt on close (with an empty queue) or stop.
    [[nodiscard]] auto receive(std::stop_token const& stopToken) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, stopToken, [this] { return !_queue.empty() || _closed; });
        if (stopToken.stop_requested() || _queue.empty())
            return std::nullopt;
        auto value = std::move(_queue.front());
        _queue.pop_front();
        return value;
    }

    /// @brief Removes and returns every queued value in arrival order.
    [[nodiscard]] auto drain() -> std::vector<T>
    {
        auto const lock = std::lock_guard(_mutex);
        auto result = std::vector<T> {};
        result.reserve(_queue.size());
        for (auto& value: _queue)
            result.push_back(std::move(value));
        _queue.clear();
        return result;
    }

    /// @brief Rejects further sends and wakes blocked receivers.
    void close()
    {
        {
            auto const lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto isClosed() const -> bool
    {
        auto const lock = std::lock_guard(_mutex);
        return _closed;
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        auto const lock = std::lock_guard(_mutex);
        return _queue.size();
    }

  private:
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<T> _queue;
    bool _closed = false;
};

} // namespace lode
