#pragma once
/**
 * @file bounded_history.h
 * @brief Thread-safe, capacity-bounded append-only history
 *
 * Used for every sample history shared between a background loop and
 * foreground callers. Appends evict the oldest entry once capacity is
 * reached; reads return copies ordered oldest to newest.
 */

#include "crdtperf/core/types.h"
#include <algorithm>
#include <deque>
#include <mutex>
#include <vector>

namespace crdtperf::core {

template<typename T>
class BoundedHistory {
public:
    static constexpr SizeT DEFAULT_CAPACITY = 1000;

    explicit BoundedHistory(SizeT capacity = DEFAULT_CAPACITY)
        : capacity_(std::max<SizeT>(capacity, 1)) {}

    // Non-copyable (owns a mutex)
    BoundedHistory(const BoundedHistory&) = delete;
    BoundedHistory& operator=(const BoundedHistory&) = delete;

    /**
     * @brief Append an entry, evicting the oldest past capacity
     */
    void push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(item));
        while (items_.size() > capacity_) {
            items_.pop_front();
            ++evicted_;
        }
    }

    /**
     * @brief Copy of all entries, oldest first
     */
    std::vector<T> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<T>(items_.begin(), items_.end());
    }

    /**
     * @brief Copy of the newest `count` entries, oldest first
     */
    std::vector<T> tail(SizeT count) const {
        std::lock_guard<std::mutex> lock(mutex_);
        count = std::min(count, items_.size());
        return std::vector<T>(items_.end() - static_cast<std::ptrdiff_t>(count), items_.end());
    }

    /**
     * @brief Copy of the entries matching a predicate, oldest first
     */
    template<typename Predicate>
    std::vector<T> filter(Predicate&& pred) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        for (const auto& item : items_) {
            if (pred(item)) out.push_back(item);
        }
        return out;
    }

    SizeT size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    SizeT capacity() const noexcept { return capacity_; }

    /**
     * @brief Number of entries dropped because of the capacity bound
     */
    UInt64 evicted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return evicted_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

private:
    const SizeT capacity_;
    mutable std::mutex mutex_;
    std::deque<T> items_;
    UInt64 evicted_{0};
};

} // namespace crdtperf::core
