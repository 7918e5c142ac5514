// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>

namespace pathspider {

/// Terminal marker: no more items will follow on a stream.
struct EndOfStream {};

/// Stream element: either a payload or the terminal marker.
template <typename T>
using StreamItem = std::variant<T, EndOfStream>;

template <typename T>
bool is_end_of_stream(const StreamItem<T>& item) noexcept {
    return std::holds_alternative<EndOfStream>(item);
}

/**
 * @brief Unbounded multi-producer / multi-consumer FIFO.
 *
 * Producers never block; consumers wait on the condition variable.
 */
template <typename T>
class BlockingQueue {
public:
    void push(T value) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    T pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !items_.empty(); });
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    /// Wait at most @p timeout; std::nullopt when nothing arrived.
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [this] { return !items_.empty(); })) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (items_.empty()) return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> items_;
};

/// Stream of payloads terminated by EndOfStream.
template <typename T>
using Stream = BlockingQueue<StreamItem<T>>;

} // namespace pathspider
