#ifndef RELICRANDO_MAILBOX_HPP
#define RELICRANDO_MAILBOX_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace relicrando {

/**
 * Unbounded FIFO message queue shared between threads.
 * After close() pushes are dropped and waiting receivers wake up; messages
 * already queued can still be drained.
 */
template<typename T>
class Mailbox {
private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> messages_;
    bool closed_ = false;

public:
    // Returns false when the mailbox is closed
    bool push(T message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            messages_.push_back(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (messages_.empty()) return false;
        out = std::move(messages_.front());
        messages_.pop_front();
        return true;
    }

    // Blocks until a message arrives; false once closed and drained
    bool pop_wait(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !messages_.empty(); });
        if (messages_.empty()) return false;
        out = std::move(messages_.front());
        messages_.pop_front();
        return true;
    }

    // As pop_wait, but gives up after timeout
    template<typename Rep, typename Period>
    bool pop_wait_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !messages_.empty(); });
        if (messages_.empty()) return false;
        out = std::move(messages_.front());
        messages_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }
};

} // namespace relicrando

#endif // RELICRANDO_MAILBOX_HPP
