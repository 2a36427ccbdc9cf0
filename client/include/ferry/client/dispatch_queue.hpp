#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace ferry::client
{

    // Multi-producer, multi-consumer FIFO with an optional capacity and a bounded-wait pop.
    template <typename T>
    class DispatchQueue
    {
    public:
        // A capacity of zero means unbounded.
        explicit DispatchQueue(std::size_t capacity = 0) : capacity_(capacity) {}

        // Returns false without blocking when the queue is full.
        bool try_push(T value)
        {
            {
                std::lock_guard lock(mutex_);
                if (capacity_ != 0 && items_.size() >= capacity_)
                {
                    return false;
                }
                items_.push_back(std::move(value));
            }
            ready_.notify_one();
            return true;
        }

        std::optional<T> pop_for(std::chrono::milliseconds timeout)
        {
            std::unique_lock lock(mutex_);
            if (!ready_.wait_for(lock, timeout, [this]
                                 { return !items_.empty(); }))
            {
                return std::nullopt;
            }
            T value = std::move(items_.front());
            items_.pop_front();
            return value;
        }

        std::size_t size() const
        {
            std::lock_guard lock(mutex_);
            return items_.size();
        }

        std::size_t capacity() const noexcept { return capacity_; }

    private:
        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable ready_;
        std::deque<T> items_;
    };

} // namespace ferry::client
