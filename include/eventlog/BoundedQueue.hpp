#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <stdexcept>
#include <vector>

namespace eventlog {

// Bounded multi-producer FIFO. Never blocks: a full queue rejects the push and
// the caller decides how to back off.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("queue capacity must be greater than 0");
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool tryPush(const T& item) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (items_.size() >= capacity_) return false;
        items_.push_back(item);
        return true;
    }

    bool tryPush(T&& item) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (items_.size() >= capacity_) return false;
        items_.push_back(std::move(item));
        return true;
    }

    // Moves up to `maxItems` from the front into `out`; returns how many were taken.
    std::size_t drainTo(std::vector<T>& out, std::size_t maxItems) {
        std::lock_guard<std::mutex> lk(mutex_);
        std::size_t taken = 0;
        while (taken < maxItems && !items_.empty()) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
            ++taken;
        }
        return taken;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return items_.empty();
    }

    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> items_;
};

} // namespace eventlog
