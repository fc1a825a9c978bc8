#include "debouncer.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "logger.hpp"

Debouncer::Debouncer(std::chrono::milliseconds delay) : delay_(delay) {
    worker_ = std::thread([this]() { run(); });
    worker_id_ = worker_.get_id();
}

Debouncer::~Debouncer() {
    stop();
    // Only left joinable when destroyed from one of its own callbacks.
    if (worker_.joinable())
        worker_.detach();
}

void Debouncer::add(const std::string& key, Callback callback) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopped_)
            return;
        // Replacing the entry drops the previous callback for this key.
        timers_[key] = Entry{std::chrono::steady_clock::now() + delay_, std::move(callback)};
    }
    cv_.notify_one();
}

void Debouncer::stop() {
    const bool on_worker = std::this_thread::get_id() == worker_id_;
    bool join = false;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        stopped_ = true;
        timers_.clear();
        if (!on_worker) {
            if (!joining_) {
                joining_ = true;
                join = true;
            } else {
                joined_cv_.wait(lk, [this] { return joined_; });
            }
        }
    }
    cv_.notify_all();
    if (!join)
        return;
    // A callback calling stop() never waits for this join.
    worker_.join();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        joined_ = true;
    }
    joined_cv_.notify_all();
}

std::size_t Debouncer::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return timers_.size();
}

void Debouncer::run() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopped_) {
        if (timers_.empty()) {
            cv_.wait(lk, [this] { return stopped_ || !timers_.empty(); });
            continue;
        }
        auto now = std::chrono::steady_clock::now();
        auto next = std::chrono::steady_clock::time_point::max();
        for (const auto& [key, entry] : timers_) {
            if (entry.deadline < next)
                next = entry.deadline;
        }
        if (next > now) {
            cv_.wait_until(lk, next);
            continue;
        }
        std::vector<Callback> due;
        for (auto it = timers_.begin(); it != timers_.end();) {
            if (it->second.deadline <= now) {
                due.push_back(std::move(it->second.callback));
                it = timers_.erase(it);
            } else {
                ++it;
            }
        }
        lk.unlock();
        for (auto& cb : due) {
            if (!cb)
                continue;
            try {
                cb();
            } catch (const std::exception& e) {
                log_error("Debounced callback failed", {{"error", e.what()}});
            } catch (...) {
                log_error("Debounced callback threw unknown exception");
            }
        }
        lk.lock();
    }
}
