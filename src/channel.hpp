// SPDX-License-Identifier: MIT

// src/channel.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tsdb_pipe {

enum class SendStatus {
    Sent,
    Full,    // buffer full (or, unbuffered, no receiver waiting)
    Closed,
};

// Channel - bounded multi-producer multi-consumer queue that can be closed
//
// Receivers drain items still buffered after Close(); Receive() returns
// std::nullopt once the channel is closed and empty. With capacity 0 the
// channel is unbuffered: a send only succeeds while a receiver is waiting.
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Non-blocking send
    SendStatus TrySend(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return SendStatus::Closed;
            if (!HasRoom()) return SendStatus::Full;
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return SendStatus::Sent;
    }

    // Blocking send. Returns false if the channel is closed.
    bool Send(T item) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || HasRoom(); });
            if (closed_) return false;
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    // Blocking receive
    std::optional<T> Receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_receivers_;
        not_full_.notify_one();
        not_empty_.wait(lock, [this] { return !queue_.empty() || closed_; });
        --waiting_receivers_;
        return PopLocked(lock);
    }

    // Receive with a timeout. std::nullopt on timeout or closed and drained.
    std::optional<T> ReceiveFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_receivers_;
        not_full_.notify_one();
        not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        --waiting_receivers_;
        return PopLocked(lock);
    }

    std::optional<T> TryReceive() {
        std::unique_lock<std::mutex> lock(mutex_);
        return PopLocked(lock);
    }

    // Idempotent. Wakes every blocked sender and receiver.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t Capacity() const { return capacity_; }

private:
    bool HasRoom() const {
        if (capacity_ == 0) return waiting_receivers_ > queue_.size();
        return queue_.size() < capacity_;
    }

    std::optional<T> PopLocked(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    size_t waiting_receivers_ = 0;
    bool closed_ = false;
};

}  // namespace tsdb_pipe
