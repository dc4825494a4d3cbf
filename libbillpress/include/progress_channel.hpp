//
// Created by Giuseppe Francione on 23/01/26.
//

/**
 * @file progress_channel.hpp
 * @brief Single-producer/single-consumer queue between a background batch and its caller.
 */

#ifndef BILLPRESS_PROGRESS_CHANNEL_HPP
#define BILLPRESS_PROGRESS_CHANNEL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace billpress {

/**
 * @brief Unbounded FIFO that can be closed by the producer.
 *
 * pop() blocks until a value arrives or the channel is closed and drained.
 * Values pushed after close() are discarded.
 */
template <typename T>
class Channel {
public:
    void push(T value) {
        {
            std::lock_guard lock(mtx_);
            if (closed_) return;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// @return The next value, or std::nullopt once closed and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return take_front();
    }

private:
    // caller holds mtx_
    std::optional<T> take_front() {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace billpress

#endif // BILLPRESS_PROGRESS_CHANNEL_HPP
