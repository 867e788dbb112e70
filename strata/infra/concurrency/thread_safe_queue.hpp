// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace strata {

//! \brief Multi-producer multi-consumer FIFO queue
//! \details When built with a capacity, pushing into a full queue drops the oldest element and counts it
template <typename T>
class ThreadSafeQueue {
  public:
    ThreadSafeQueue() = default;
    explicit ThreadSafeQueue(size_t capacity) : capacity_{capacity} {}

    void push(T const& data) {
        {
            std::unique_lock lock(mutex_);
            make_room();
            queue_.push_back(data);
        }  // lock.unlock();
        condition_variable_.notify_one();
    }

    void push(T&& data) {
        {
            std::unique_lock lock(mutex_);
            make_room();
            queue_.push_back(std::move(data));
        }  // lock.unlock();
        condition_variable_.notify_one();
    }

    //! \brief Number of elements dropped because the queue was full
    size_t dropped() const {
        std::unique_lock lock(mutex_);
        return dropped_;
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return pop_front();
    }

    T wait_and_pop() {
        std::unique_lock lock(mutex_);
        condition_variable_.wait(lock, [this] { return !queue_.empty(); });
        return pop_front();
    }

    template <typename Duration>
    std::optional<T> timed_wait_and_pop(Duration const& wait_duration) {
        std::unique_lock lock(mutex_);
        if (!condition_variable_.wait_for(lock, wait_duration, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        return pop_front();
    }

  private:
    // Requires mutex_ held
    void make_room() {
        if (!capacity_) return;
        while (!queue_.empty() && queue_.size() >= *capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
    }

    // Requires mutex_ held and queue_ not empty
    T pop_front() {
        T value{std::move(queue_.front())};
        queue_.pop_front();
        return value;
    }

    std::optional<size_t> capacity_;
    size_t dropped_{0};
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condition_variable_;
};

}  // namespace strata
