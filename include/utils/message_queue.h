#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace fix_order_entry::utils
{
    // Bounded FIFO hand-off between threads. After shutdown() pushes are
    // rejected while already queued items can still be popped.
    template <typename T>
    class MessageQueue
    {
    public:
        explicit MessageQueue(size_t max_size = 1024,
                              const std::string &queue_name = "message_queue")
            : max_size_(max_size), queue_name_(queue_name), is_shutdown_(false),
              total_pushed_(0), total_popped_(0), total_rejected_(0)
        {
        }

        ~MessageQueue()
        {
            shutdown();
        }

        MessageQueue(const MessageQueue &) = delete;
        MessageQueue &operator=(const MessageQueue &) = delete;

        // Returns false when the queue is full or shut down
        bool push(T item)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (is_shutdown_.load(std::memory_order_relaxed) || queue_.size() >= max_size_)
                {
                    total_rejected_.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
                queue_.push_back(std::move(item));
                total_pushed_.fetch_add(1, std::memory_order_relaxed);
            }
            not_empty_cv_.notify_one();
            return true;
        }

        // Blocks until an item arrives or the queue is shut down and empty
        bool pop(T &item)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_cv_.wait(lock, [this]
                               { return !queue_.empty() || is_shutdown_.load(std::memory_order_relaxed); });
            return popLocked(item);
        }

        bool pop(T &item, std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_cv_.wait_for(lock, timeout, [this]
                                   { return !queue_.empty() || is_shutdown_.load(std::memory_order_relaxed); });
            return popLocked(item);
        }

        bool tryPop(T &item)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return popLocked(item);
        }

        void shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                is_shutdown_.store(true, std::memory_order_relaxed);
            }
            not_empty_cv_.notify_all();
        }

        bool isShutdown() const { return is_shutdown_.load(std::memory_order_relaxed); }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return queue_.size();
        }

        bool empty() const { return size() == 0; }
        size_t capacity() const { return max_size_; }
        const std::string &name() const { return queue_name_; }

        uint64_t getTotalPushed() const { return total_pushed_.load(std::memory_order_relaxed); }
        uint64_t getTotalPopped() const { return total_popped_.load(std::memory_order_relaxed); }
        uint64_t getTotalRejected() const { return total_rejected_.load(std::memory_order_relaxed); }

    private:
        bool popLocked(T &item)
        {
            if (queue_.empty())
            {
                return false;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
            total_popped_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }

        std::deque<T> queue_;
        mutable std::mutex mutex_;
        std::condition_variable not_empty_cv_;

        const size_t max_size_;
        const std::string queue_name_;
        std::atomic<bool> is_shutdown_;

        std::atomic<uint64_t> total_pushed_;
        std::atomic<uint64_t> total_popped_;
        std::atomic<uint64_t> total_rejected_;
    };

} // namespace fix_order_entry::utils
