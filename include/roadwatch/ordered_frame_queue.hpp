#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>

namespace roadwatch {

// Bounded producer/consumer queue keyed by frame index. Producers may finish
// out of order; pop() hands items out strictly in index order.
template <typename T>
class OrderedFrameQueue {
public:
    explicit OrderedFrameQueue(size_t max_items = 4, int64_t first_index = 0)
        : max_items_(max_items), next_index_(first_index) {}

    // Blocks while the queue is full, unless `index` is the one the consumer
    // is waiting for. Returns false once stopped or for an index already passed.
    bool push(int64_t index, T item) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_full_.wait(lock, [&] { return stopped_ || items_.size() < max_items_ || index == next_index_; });
        if (stopped_ || index < next_index_) return false;
        items_.emplace(index, std::move(item));
        lock.unlock();
        cv_empty_.notify_all();
        return true;
    }

    // Waits for the next index in sequence. Returns false when stopped and the
    // next item will never arrive.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_empty_.wait(lock, [&] { return ready() || stopped_; });
        if (!ready()) return false;
        auto it = items_.begin();
        out = std::move(it->second);
        items_.erase(it);
        next_index_++;
        while (skipped_.erase(next_index_) > 0) next_index_++;
        lock.unlock();
        cv_full_.notify_all();
        return true;
    }

    // Skips an index the producer will never deliver (e.g. an undecodable frame).
    void skip(int64_t index) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            skipped_.insert(index);
            while (skipped_.count(next_index_) > 0) {
                skipped_.erase(next_index_);
                next_index_++;
            }
        }
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
        }
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return items_.size();
    }

private:
    bool ready() const { return !items_.empty() && items_.begin()->first == next_index_; }

    size_t max_items_;
    int64_t next_index_;
    std::map<int64_t, T> items_;
    std::set<int64_t> skipped_;
    mutable std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    bool stopped_{false};
};

}  // namespace roadwatch
