#ifndef RENKEI_THREAD_SAFE_QUEUE_H
#define RENKEI_THREAD_SAFE_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace renkei::common {

/**
 * @brief A closable, thread-safe FIFO used to hand work between threads.
 * @tparam T The type of data to be stored in the queue.
 *
 * Once close() is called, push() is ignored and pop() drains the remaining
 * items before returning std::nullopt.
 */
template <typename T>
class ThreadSafeQueue {
public:
    /**
     * @brief Pushes data to the queue.
     * @param value The data to be pushed.
     * @return False if the queue has been closed.
     */
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Pops data from the queue. Waits until data arrives or the queue is closed.
     * @return The data popped from the queue, or std::nullopt once closed and empty.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /**
     * @brief Tries to pop data from the queue with a timeout.
     * @param timeout Maximum time to wait.
     * @return The data, or std::nullopt on timeout / closed and empty.
     */
    std::optional<T> tryPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
            return std::nullopt;
        }
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /**
     * @brief Rejects further pushes and wakes every waiting consumer.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.empty();
    }

private:
    std::deque<T> queue_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool closed_{false};
};

} // namespace renkei::common

#endif // RENKEI_THREAD_SAFE_QUEUE_H
