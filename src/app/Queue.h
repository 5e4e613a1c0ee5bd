#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

/*! Thread safe FIFO with a blocking pop().
 *
 *  Optionally bounded. A bounded queue never blocks the producer: when it is
 *  full, the oldest item is discarded and counted.
 */
template <typename T>
class Queue
{
public:
    using type_t = T;

    // 0 means unbounded
    explicit Queue(std::size_t maxItems = 0)
        : max_items_{maxItems} {}

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    /*! Appends an item.
     *
     *  Items pushed after stop() are discarded.
     *  @return false if the oldest item had to go to make room.
     */
    bool push(T && data)
    {
        bool dropped = false;
        {
            std::lock_guard lock{mutex_};
            if (stopped_) {
                return true;
            }
            if (max_items_ && items_.size() >= max_items_) {
                items_.pop_front();
                ++dropped_;
                dropped = true;
            }
            items_.push_back(std::move(data));
        }
        cv_.notify_one();
        return !dropped;
    }

    // Blocks until data or stop. Items pushed before stop() are still delivered.
    bool pop(T &out)
    {
        std::unique_lock lock{mutex_};
        cv_.wait(lock, [&]{ return !items_.empty() || stopped_; });
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    void stop() {
        {
            std::lock_guard lock{mutex_};
            stopped_ = true;
        }
        cv_.notify_all();
    }

    // Empties the queue and makes it usable again after stop()
    void reset() {
        std::lock_guard lock{mutex_};
        items_.clear();
        stopped_ = false;
        dropped_ = 0;
    }

    std::size_t size() const {
        std::lock_guard lock{mutex_};
        return items_.size();
    }

    bool stopped() const noexcept { return stopped_; }
    std::size_t dropped() const noexcept { return dropped_; }
    std::size_t capacity() const noexcept { return max_items_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    const std::size_t max_items_;
    std::atomic_bool stopped_{false};
    std::atomic_size_t dropped_{0};
};
