#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "core/events/EngineEvent.h"

namespace tradeguard {
namespace core {

enum class OverflowPolicy {
    DROP_OLDEST,   // evict the oldest entry, count it as dropped
    BLOCK          // producer waits for space (or for close())
};

// Bounded multi-producer FIFO. Delivery order is publish order.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity, OverflowPolicy policy = OverflowPolicy::DROP_OLDEST)
        : capacity_(capacity == 0 ? 1 : capacity)
        , policy_(policy) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // false when the channel is closed
    bool publish(T value) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (queue_.size() >= capacity_) {
                if (policy_ == OverflowPolicy::BLOCK) {
                    not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
                    if (closed_) {
                        return false;
                    }
                } else {
                    queue_.pop_front();
                    ++dropped_;
                }
            }
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> tryPop() {
        std::optional<T> value;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return std::nullopt;
            }
            value = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return value;
    }

    std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::optional<T> value;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
                return std::nullopt;
            }
            if (queue_.empty()) {
                return std::nullopt;
            }
            value = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return value;
    }

    std::vector<T> drain() {
        std::vector<T> items;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items.reserve(queue_.size());
            for (auto& item : queue_) {
                items.push_back(std::move(item));
            }
            queue_.clear();
        }
        not_full_.notify_all();
        return items;
    }

    // Wakes blocked producers and consumers; later publishes are refused.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }
    OverflowPolicy policy() const { return policy_; }

    std::size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const std::size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

using EventChannel = BoundedChannel<EngineEvent>;

} // namespace core
} // namespace tradeguard
