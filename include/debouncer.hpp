#ifndef DEBOUNCER_HPP
#define DEBOUNCER_HPP
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Per-key delayed callback coalescer.
 *
 * Each call to `add()` replaces whatever callback was pending for the key and
 * restarts its delay. A single scheduler thread fires expired keys; callbacks
 * run on that thread with no lock held.
 */
class Debouncer {
  public:
    using Callback = std::function<void()>;

    static constexpr std::chrono::milliseconds kDefaultDelay{100};

    explicit Debouncer(std::chrono::milliseconds delay = kDefaultDelay);
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    /**
     * @brief Schedule @p callback for @p key, cancelling any pending one.
     *
     * Ignored after `stop()`.
     */
    void add(const std::string& key, Callback callback);

    /**
     * @brief Cancel all pending callbacks and shut the scheduler down.
     *
     * Safe to call more than once, concurrently and from inside a callback.
     * Outside a callback it returns once the scheduler thread has exited; a
     * concurrent caller waits for the first one to finish joining.
     */
    void stop();

    /// Number of keys with a callback still waiting to fire.
    std::size_t pending() const;

    std::chrono::milliseconds delay() const { return delay_; }

  private:
    struct Entry {
        std::chrono::steady_clock::time_point deadline;
        Callback callback;
    };

    void run();

    const std::chrono::milliseconds delay_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<std::string, Entry> timers_;
    bool stopped_ = false;
    bool joining_ = false;
    bool joined_ = false;
    std::condition_variable joined_cv_;
    std::thread worker_;
    std::thread::id worker_id_;
};

#endif // DEBOUNCER_HPP
