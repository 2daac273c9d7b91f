/**
 * @file CaptureQueue.hpp
 * @brief Fixed-capacity, drop-oldest queue between the driver and the processing thread.
 */

#ifndef OMEGA_CAPTURE_QUEUE_HPP
#define OMEGA_CAPTURE_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace omega {

/**
 * @brief Bounded ring buffer that never makes the producer wait.
 *
 * push() on a full queue evicts exactly one oldest entry before inserting,
 * so under a slow consumer the queue holds the newest `capacity` items in
 * arrival order. pop() waits with a timeout; an empty result means "nothing
 * arrived yet" and the caller simply retries.
 *
 * Critical sections only move items. Evicted and cleared items are
 * destroyed after the lock is released, and latest() copies under the
 * lock, so T should be cheap to copy (AudioManager queues shared_ptrs).
 */
template<typename T>
class CaptureQueue {
public:
    explicit CaptureQueue(size_t capacity)
        : slots_(capacity)
    {
        if (capacity == 0) {
            throw std::invalid_argument("CaptureQueue capacity must be positive");
        }
    }

    CaptureQueue(const CaptureQueue&) = delete;
    CaptureQueue& operator=(const CaptureQueue&) = delete;

    /**
     * @brief Insert an item, evicting the oldest one when full.
     * @return true if an item was evicted.
     */
    bool push(T item) {
        std::optional<T> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (count_ == slots_.size()) {
                evicted.emplace(std::move(slots_[head_]));
                head_ = (head_ + 1) % slots_.size();
                --count_;
            }
            slots_[(head_ + count_) % slots_.size()] = std::move(item);
            ++count_;
        }
        // The evicted item is destroyed here, outside the lock
        if (evicted) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        not_empty_.notify_one();
        return evicted.has_value();
    }

    /**
     * @brief Wait up to `timeout` for the oldest item.
     * @return std::nullopt on timeout.
     */
    template<typename Rep, typename Period>
    std::optional<T> pop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return count_ > 0; })) {
            return std::nullopt;
        }
        return take_front();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (count_ == 0) return std::nullopt;
        return take_front();
    }

    /**
     * @brief Copy of the most recently pushed item, left in place.
     */
    std::optional<T> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (count_ == 0) return std::nullopt;
        return slots_[(head_ + count_ - 1) % slots_.size()];
    }

    /**
     * @brief Discard everything queued.
     * @return Number of items discarded.
     */
    size_t clear() {
        std::vector<T> discarded;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            discarded.reserve(count_);
            for (size_t i = 0; i < count_; ++i) {
                discarded.push_back(std::move(slots_[(head_ + i) % slots_.size()]));
            }
            head_ = 0;
            count_ = 0;
        }
        return discarded.size();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return slots_.size(); }

    // Total evictions since construction
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    T take_front() {
        T item = std::move(slots_[head_]);
        slots_[head_] = T{};
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return item;
    }

    std::vector<T> slots_;
    size_t head_ = 0;
    size_t count_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::atomic<size_t> dropped_{0};
};

} // namespace omega

#endif // OMEGA_CAPTURE_QUEUE_HPP
