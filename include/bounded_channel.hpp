#ifndef BOUNDED_CHANNEL_HPP
#define BOUNDED_CHANNEL_HPP
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

/**
 * @brief Fixed-capacity multi-producer queue with lossy sends.
 *
 * Producers never block: `try_send()` drops the value when the queue is full
 * or closed and bumps a drop counter instead. Consumers block in `receive()`
 * until a value arrives or the channel is closed and drained.
 */
template <typename T> class BoundedChannel {
  public:
    explicit BoundedChannel(std::size_t capacity) : capacity_(capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Enqueue @p value without blocking.
     *
     * @return `true` if the value was queued, `false` if it was dropped.
     */
    bool try_send(T value) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_ || queue_.size() >= capacity_) {
                dropped_.fetch_add(1);
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Wait for the next value.
     *
     * @return `false` once the channel is closed and empty.
     */
    bool receive(T& out) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty())
            return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    /**
     * @brief Wait at most @p timeout for the next value.
     */
    template <typename Rep, typename Period>
    std::optional<T> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [this] { return !queue_.empty() || closed_; }))
            return std::nullopt;
        if (queue_.empty())
            return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (queue_.empty())
            return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /// Reject further sends and wake all waiting receivers. Queued values stay readable.
    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }

    /// Number of values rejected by `try_send()` so far.
    std::size_t dropped() const { return dropped_.load(); }

  private:
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
    std::atomic<std::size_t> dropped_{0};
};

#endif // BOUNDED_CHANNEL_HPP
